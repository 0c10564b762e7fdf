#pragma once

#include <memory>
#include <string>
#include <arrow/result.h>
#include "parcel/engine/result_stream.h"

namespace parcel {
namespace engine {

/**
 * @brief SQL engine producing results as a stream of Arrow batches
 *
 * Execute must be safe to call concurrently for different statements;
 * each returned stream is used by a single caller.
 */
class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    virtual arrow::Result<std::unique_ptr<ResultStream>> Execute(const std::string& sql) = 0;
};

} // namespace engine
} // namespace parcel
