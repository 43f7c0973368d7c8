#include "resilient_rest/backoff.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>

namespace resilient_rest {

    std::chrono::milliseconds backoff_delay(const BackoffPolicy& policy,
                                            std::size_t attempt) {
        const double cap = static_cast<double>(policy.max_delay.count());
        const double raw = static_cast<double>(policy.base_delay.count()) *
                           std::pow(policy.factor, static_cast<double>(attempt));
        // pow overflows to inf for large attempts; the cap absorbs it
        const double bounded = std::isfinite(raw) ? std::min(raw, cap) : cap;
        return std::chrono::milliseconds(
            static_cast<std::int64_t>(std::llround(bounded)));
    }

    Jitter::Jitter(const JitterConfiguration& cfg)
        : Jitter(cfg.min_factor, cfg.max_factor) {}

    Jitter::Jitter(double min_factor, double max_factor)
        : Jitter(min_factor, max_factor, std::random_device{}()) {}

    Jitter::Jitter(double min_factor, double max_factor, std::uint32_t seed)
        : min_(min_factor), max_(max_factor), rng_(seed) {
        if (!(min_ >= 0.0) || !(max_ >= min_)) {
            throw std::invalid_argument(
                "Jitter requires 0 <= min_factor <= max_factor");
        }
    }

    std::chrono::milliseconds Jitter::apply(std::chrono::milliseconds delay) {
        double factor = min_;
        if (max_ > min_) {
            std::uniform_real_distribution<double> dist(min_, max_);
            std::lock_guard<std::mutex> lk(mu_);
            factor = dist(rng_);
        }
        return std::chrono::milliseconds(static_cast<std::int64_t>(
            std::llround(static_cast<double>(delay.count()) * factor)));
    }

    RetrySchedule::RetrySchedule(BackoffPolicy policy, Jitter& jitter,
                                 Limits limits, clock::time_point started)
        : policy_(policy), jitter_(jitter), limits_(limits), started_(started) {}

    std::chrono::milliseconds RetrySchedule::elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::now() - started_);
    }

    std::optional<std::chrono::milliseconds> RetrySchedule::remaining() const {
        if (!limits_.max_elapsed) return std::nullopt;
        return std::max(std::chrono::milliseconds::zero(),
                        *limits_.max_elapsed - elapsed());
    }

    bool RetrySchedule::exhausted() const {
        if (limits_.max_attempts && attempts_ >= *limits_.max_attempts)
            return true;
        if (limits_.max_elapsed && elapsed() >= *limits_.max_elapsed)
            return true;
        return false;
    }

    std::chrono::milliseconds RetrySchedule::next_delay(
        std::optional<std::chrono::milliseconds> hint) {
        std::chrono::milliseconds delay;
        if (hint) {
            delay = std::max(*hint, jitter_.apply(*hint));
        } else {
            const std::size_t index = attempts_ == 0 ? 0 : attempts_ - 1;
            delay = jitter_.apply(backoff_delay(policy_, index));
        }
        if (auto left = remaining()) delay = std::min(delay, *left);
        return delay;
    }

    std::optional<std::chrono::milliseconds> parse_retry_after(
        std::string_view value) {
        while (!value.empty() &&
               std::isspace(static_cast<unsigned char>(value.front())))
            value.remove_prefix(1);
        while (!value.empty() &&
               std::isspace(static_cast<unsigned char>(value.back())))
            value.remove_suffix(1);
        if (value.empty()) return std::nullopt;

        if (std::isdigit(static_cast<unsigned char>(value.front()))) {
            std::size_t dots = 0;
            for (char c : value) {
                if (c == '.') {
                    ++dots;
                } else if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return std::nullopt;
                }
            }
            if (dots > 1) return std::nullopt;

            double seconds = 0.0;
            const char* last = value.data() + value.size();
            auto [ptr, ec] = std::from_chars(value.data(), last, seconds,
                                             std::chars_format::fixed);
            if (ec == std::errc::result_out_of_range) return kRetryAfterCeiling;
            if (ec != std::errc{} || ptr != last) return std::nullopt;

            const std::chrono::duration<double, std::milli> wait(seconds *
                                                                 1000.0);
            if (!(wait < kRetryAfterCeiling)) return kRetryAfterCeiling;
            return std::chrono::milliseconds(
                static_cast<std::int64_t>(std::llround(wait.count())));
        }

        // IMF-fixdate, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
        std::tm tm{};
        std::istringstream in{std::string(value)};
        in.imbue(std::locale::classic());
        in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
        if (in.fail()) return std::nullopt;

        const std::time_t when = ::timegm(&tm);
        if (when == static_cast<std::time_t>(-1)) return std::nullopt;

        const auto target = std::chrono::system_clock::from_time_t(when);
        const auto now = std::chrono::system_clock::now();
        if (target <= now) return std::chrono::milliseconds::zero();
        return std::min(
            std::chrono::duration_cast<std::chrono::milliseconds>(target - now),
            kRetryAfterCeiling);
    }

}  // namespace resilient_rest
