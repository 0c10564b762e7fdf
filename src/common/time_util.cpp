#include "parcel/common/time_util.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace parcel {

std::string FormatIso8601(Timestamp ts) {
    using namespace std::chrono;

    auto seconds_part = floor<seconds>(ts);
    auto micros = duration_cast<microseconds>(ts - seconds_part).count();

    std::time_t tt = system_clock::to_time_t(seconds_part);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros
        << "+00:00";
    return oss.str();
}

arrow::Result<Timestamp> ParseIso8601(const std::string& text) {
    using namespace std::chrono;

    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return arrow::Status::Invalid("Not an ISO-8601 timestamp: '", text, "'");
    }

    int64_t micros = 0;
    if (iss.peek() == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            char c = static_cast<char>(iss.get());
            if (digits < 6) {
                micros = micros * 10 + (c - '0');
            }
            ++digits;
        }
        if (digits == 0) {
            return arrow::Status::Invalid("Empty fraction in timestamp: '", text, "'");
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }

    int64_t offset_seconds = 0;
    int next = iss.peek();
    if (next == 'Z' || next == 'z') {
        iss.get();
    } else if (next == '+' || next == '-') {
        char sign = static_cast<char>(iss.get());
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        iss >> hours >> colon >> minutes;
        if (iss.fail() || colon != ':') {
            return arrow::Status::Invalid("Bad UTC offset in timestamp: '", text, "'");
        }
        offset_seconds = (hours * 3600 + minutes * 60) * (sign == '-' ? -1 : 1);
    }

    if (iss.peek() != std::char_traits<char>::eof()) {
        return arrow::Status::Invalid("Trailing characters in timestamp: '", text, "'");
    }

    std::time_t tt = timegm(&tm);
    return system_clock::from_time_t(tt) - seconds(offset_seconds) + microseconds(micros);
}

} // namespace parcel
