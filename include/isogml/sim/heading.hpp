#pragma once

#include "../core/types.hpp"
#include "../geo/transforms.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <numbers>

namespace isogml::sim {

    // Net squared displacement (m²) needed before a new heading is taken
    inline constexpr f64 HEADING_MIN_MOVEMENT_SQ = 0.01;
    inline constexpr usize HEADING_FILTER_HALF_WIDTH = 2;

    // Wraps to (-pi, pi]
    inline f64 wrap_angle(f64 a) noexcept {
        constexpr f64 pi = std::numbers::pi;
        a = std::fmod(a + pi, 2.0 * pi);
        if (a <= 0.0)
            a += 2.0 * pi;
        return a - pi;
    }

    struct HeadingStats {
        usize forward_steps = 0;
        usize reverse_steps = 0;
        usize updates = 0;
    };

    // ─── Track heading ───────────────────────────────────────────────────────────
    // Heading (ENU, radians from east) of the vehicle's forward axis per fix.
    // A new heading is taken once the fixes have moved 0.1 m; a jump of more than
    // 90 degrees is read as a change of driving direction, so the heading keeps
    // pointing along the vehicle while reversing. If reversing steps outnumber
    // forward ones the initial direction was guessed wrong and all headings flip.
    inline dp::Vector<f64> estimate_raw_headings(const dp::Vector<geo::Enu> &fixes, HeadingStats *stats = nullptr) {
        constexpr f64 pi = std::numbers::pi;
        dp::Vector<f64> heading(fixes.size(), 0.0);
        HeadingStats s;

        f64 acc_x = 0.0;
        f64 acc_y = 0.0;
        bool have_heading = false;
        bool reversing = false;

        for (usize i = 0; i < fixes.size(); ++i) {
            if (i > 0) {
                acc_x += fixes[i].east - fixes[i - 1].east;
                acc_y += fixes[i].north - fixes[i - 1].north;
                heading[i] = heading[i - 1];
            }
            if (acc_x * acc_x + acc_y * acc_y <= HEADING_MIN_MOVEMENT_SQ)
                continue;

            f64 h = std::atan2(acc_y, acc_x);
            acc_x = 0.0;
            acc_y = 0.0;
            ++s.updates;

            if (!have_heading) {
                for (usize j = 0; j < i; ++j)
                    heading[j] = h;
                have_heading = true;
            } else {
                if (reversing) {
                    h += pi;
                    ++s.reverse_steps;
                } else {
                    ++s.forward_steps;
                }
                if (std::abs(wrap_angle(h - heading[i - 1])) > pi / 2.0) {
                    reversing = !reversing;
                    h += pi;
                }
            }
            heading[i] = wrap_angle(h);
        }

        if (s.reverse_steps > s.forward_steps) {
            for (auto &h : heading)
                h = wrap_angle(h + pi);
        }

        if (stats)
            *stats = s;
        return heading;
    }

    // Centered 5-sample circular moving average; the two samples at either end
    // are left as they are.
    inline dp::Vector<f64> smooth_headings(const dp::Vector<f64> &heading) {
        constexpr usize w = HEADING_FILTER_HALF_WIDTH;
        dp::Vector<f64> out = heading;
        if (heading.size() < 2 * w + 1)
            return out;

        for (usize i = w; i + w < heading.size(); ++i) {
            f64 sum = 0.0;
            for (usize j = i - w; j <= i + w; ++j)
                sum += wrap_angle(heading[j] - heading[i]);
            out[i] = wrap_angle(heading[i] + sum / static_cast<f64>(2 * w + 1));
        }
        return out;
    }

    inline dp::Vector<f64> estimate_headings(const dp::Vector<geo::Enu> &fixes, HeadingStats *stats = nullptr) {
        HeadingStats s;
        auto raw = estimate_raw_headings(fixes, &s);
        echo::category("isogml.sim")
            .debug("heading: ", s.updates, " updates, ", s.forward_steps, " forward / ", s.reverse_steps,
                   " reverse steps");
        if (stats)
            *stats = s;
        return smooth_headings(raw);
    }

} // namespace isogml::sim
