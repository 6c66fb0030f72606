#include "admin/logging.h"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string_view>

namespace admin {
namespace {

void escapeInto(std::string &out, std::string_view value) {
    static constexpr char kHex[] = "0123456789abcdef";
    for (char ch : value) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default: {
                const auto byte = static_cast<unsigned char>(ch);
                if (byte < 0x20) {
                    out += "\\u00";
                    out += kHex[byte >> 4];
                    out += kHex[byte & 0x0f];
                } else {
                    out += ch;
                }
                break;
            }
        }
    }
}

// UTC with millisecond precision; several stock events land in one second.
std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc_tm{};
#if defined(_WIN32)
    gmtime_s(&utc_tm, &time);
#else
    gmtime_r(&time, &utc_tm);
#endif
    std::ostringstream stamp;
    stamp << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
          << std::setfill('0') << millis.count() << 'Z';
    return stamp.str();
}

// Builds one JSON object; absent optionals are left out.
class JsonLine {
public:
    JsonLine &required(const char *key, std::string_view value) {
        openKey(key);
        body_ += '"';
        escapeInto(body_, value);
        body_ += '"';
        return *this;
    }

    JsonLine &text(const char *key, const std::optional<std::string> &value) {
        if (value && !value->empty()) {
            required(key, *value);
        }
        return *this;
    }

    template <typename T>
    JsonLine &number(const char *key, const std::optional<T> &value) {
        if (value) {
            openKey(key);
            body_ += std::to_string(*value);
        }
        return *this;
    }

    std::string finish() {
        body_ += '}';
        return std::move(body_);
    }

private:
    void openKey(const char *key) {
        body_ += body_.size() == 1 ? "\"" : ",\"";
        body_ += key;
        body_ += "\":";
    }

    std::string body_{"{"};
};

}  // namespace

StructuredLogger::StructuredLogger() : out_(&std::cout) {}

StructuredLogger::StructuredLogger(std::ostream &out) : out_(&out) {}

void StructuredLogger::log(const std::string &level,
                           const std::string &event,
                           const std::string &message,
                           const LogFields &fields) {
    const auto line = JsonLine()
                          .required("timestamp", utcTimestamp())
                          .required("level", level)
                          .required("event", event)
                          .required("message", message)
                          .text("trace_id", fields.trace_id)
                          .number("sale_id", fields.sale_id)
                          .number("variant_id", fields.variant_id)
                          .number("branch_id", fields.branch_id)
                          .number("reservation_id", fields.reservation_id)
                          .number("cart_id", fields.cart_id)
                          .number("quantity", fields.quantity)
                          .number("available", fields.available)
                          .number("count", fields.count)
                          .text("reason", fields.reason)
                          .finish();

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line << '\n';
    out_->flush();
}

std::string StructuredLogger::generateTraceId() {
    std::array<unsigned char, 16> bytes{};
    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto &byte : bytes) {
        byte = static_cast<unsigned char>(dist(generator));
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string trace_id;
    trace_id.reserve(bytes.size() * 2);
    for (unsigned char byte : bytes) {
        trace_id += kHex[byte >> 4];
        trace_id += kHex[byte & 0x0f];
    }
    return trace_id;
}

}  // namespace admin
