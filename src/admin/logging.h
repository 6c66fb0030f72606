#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace admin {

struct LogFields {
    std::optional<std::string> trace_id;
    std::optional<std::uint64_t> sale_id;
    std::optional<std::uint64_t> variant_id;
    std::optional<std::uint64_t> branch_id;
    std::optional<std::uint64_t> reservation_id;
    std::optional<std::uint64_t> cart_id;
    std::optional<std::int64_t> quantity;
    std::optional<std::int64_t> available;
    std::optional<std::uint64_t> count;
    std::optional<std::string> reason;
};

class StructuredLogger {
public:
    StructuredLogger();
    explicit StructuredLogger(std::ostream &out);

    void log(const std::string &level,
             const std::string &event,
             const std::string &message,
             const LogFields &fields = {});

    static std::string generateTraceId();

private:
    std::ostream *out_;
    std::mutex mutex_;
};

}  // namespace admin
