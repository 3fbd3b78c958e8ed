#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "profile/profile.hpp"
#include "util/errors.hpp"
#include "util/nulls.hpp"

namespace csvsa {

using rng_type = std::mt19937_64;

// One generator per run, seeded once; no seed means a fresh one from random_device.
inline rng_type make_rng(std::optional<std::uint64_t> seed) {
    if (seed) return rng_type(*seed);
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return rng_type(seq);
}

/**
 * Draws substitute cell values that match a column_profile.
 *
 * Each call to synthesize() draws a new value, so equal source cells do not map to
 * equal substitutes. Categorical columns are sampled uniformly over the observed
 * categories; source frequencies are not reproduced.
 */
class value_synthesizer {
public:
    // Generated text never spells one of null_tokens, so it cannot read back as null.
    explicit value_synthesizer(rng_type& rng,
                               std::vector<std::string> null_tokens = default_null_tokens())
        : rng_(rng), null_tokens_(std::move(null_tokens)) {}

    std::string synthesize(const column_profile& p) {
        if (!(p.null_fraction >= 0.0 && p.null_fraction <= 1.0))
            throw synthesis_error(fmt::format("null fraction {} outside [0, 1]", p.null_fraction));

        std::bernoulli_distribution null_draw(p.null_fraction);
        if (null_draw(rng_)) return p.null_token;

        return std::visit([this](const auto& shape) { return draw(shape); }, p.shape);
    }

private:
    std::string draw(const integer_column& c) {
        if (c.min > c.max)
            throw synthesis_error(fmt::format("integer range [{}, {}] is empty", c.min, c.max));
        if (c.min == c.max) return fmt::format("{}", c.min);
        std::uniform_int_distribution<std::int64_t> dist(c.min, c.max);
        return fmt::format("{}", dist(rng_));
    }

    std::string draw(const float_column& c) {
        if (!(c.min <= c.max) || !std::isfinite(c.min) || !std::isfinite(c.max))
            throw synthesis_error(fmt::format("float range [{}, {}] is not usable", c.min, c.max));
        double v = c.min;
        if (c.max > c.min) {
            if (std::isfinite(c.max - c.min)) {
                std::uniform_real_distribution<double> dist(c.min, c.max);
                v = dist(rng_);
            } else {
                // span overflows a double; interpolate instead
                std::uniform_real_distribution<double> unit(0.0, 1.0);
                const double u = unit(rng_);
                v = c.min + u * c.max - u * c.min;
            }
        }
        if (c.decimals < 0) return fmt::format("{}", std::clamp(v, c.min, c.max));

        const double scale = std::pow(10.0, c.decimals);
        if (std::isfinite(scale) && std::isfinite(v * scale)) v = std::round(v * scale) / scale;
        v = std::clamp(v, c.min, c.max);
        if (v == 0.0) v = 0.0; // no "-0.00"
        return fmt::format("{:.{}f}", v, c.decimals);
    }

    std::string draw(const categorical_column& c) {
        if (c.categories.empty())
            throw synthesis_error("categorical column has no categories to draw from");
        std::uniform_int_distribution<std::size_t> dist(0, c.categories.size() - 1);
        return c.categories[dist(rng_)];
    }

    std::string draw(const text_column& c) {
        static constexpr char alphabet[] =
            "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
        if (c.min_length > c.max_length)
            throw synthesis_error(fmt::format("text length range [{}, {}] is empty",
                                              c.min_length, c.max_length));
        std::uniform_int_distribution<std::size_t> len_dist(c.min_length, c.max_length);
        std::uniform_int_distribution<std::size_t> char_dist(0, sizeof(alphabet) - 2);
        for (int attempt = 0; attempt < max_text_attempts; ++attempt) {
            const std::size_t len = len_dist(rng_);
            std::string out;
            out.reserve(len);
            for (std::size_t i = 0; i < len; ++i) out.push_back(alphabet[char_dist(rng_)]);
            if (!is_null_like(out, null_tokens_)) return out;
        }
        throw synthesis_error(fmt::format("no non-null text of length [{}, {}] after {} attempts",
                                          c.min_length, c.max_length, max_text_attempts));
    }

    std::string draw(const boolean_column& c) {
        std::bernoulli_distribution coin(0.5);
        return coin(rng_) ? c.true_literal : c.false_literal;
    }

    static constexpr int max_text_attempts = 1000;

    rng_type& rng_;
    std::vector<std::string> null_tokens_;
};

}
