#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <random>
#include <sstream>
#include <iomanip>

namespace tally {

/**
 * Uuid - 128-bit identifier used for queued records, batches and
 * locally created expenses.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t half = 0; half < 2; ++half) {
            uint64_t word = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;

        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or bare hex form. Returns nullopt on malformed input.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        Bytes bytes{};
        size_t nibbles = 0;
        for (char c : str) {
            if (c == '-') continue;
            int value = hex_value(c);
            if (value < 0 || nibbles >= BYTE_SIZE * 2) return std::nullopt;
            auto& byte = bytes[nibbles / 2];
            byte = static_cast<uint8_t>((byte << 4) | value);
            ++nibbles;
        }
        if (nibbles != BYTE_SIZE * 2) return std::nullopt;
        return Uuid(bytes);
    }

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch (stored as INTEGER in SQLite).
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] constexpr bool is_epoch() const noexcept {
        return millis_ == 0;
    }

    /**
     * ISO 8601 in UTC with millisecond precision.
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(TimePoint(Duration(millis_)));
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &time_t);
#else
        gmtime_r(&time_t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace tally

namespace std {
    template<>
    struct hash<tally::Uuid> {
        size_t operator()(const tally::Uuid& uuid) const noexcept {
            size_t h = 0;
            for (auto b : uuid.bytes()) {
                h ^= static_cast<size_t>(b) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
