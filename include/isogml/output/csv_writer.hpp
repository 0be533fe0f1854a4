#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../timelog/channel.hpp"
#include "naming.hpp"
#include <cstdio>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace isogml::output {

    // ─── CSV rendering ───────────────────────────────────────────────────────────
    // One line of channel names, then one line per row. Every field is terminated
    // by "; ", header channels first.
    inline Result<dp::String> format_csv(const timelog::ChannelSet &header, const timelog::ChannelSet &data) {
        const usize rows = header.rows();
        if (!header.uniform() || !data.uniform() || (!data.empty() && data.rows() != rows)) {
            return Result<dp::String>::err(Error::invalid_argument("CSV channels have unequal row counts"));
        }

        dp::String out;
        for (const auto &c : header.columns())
            out += c.name() + "; ";
        for (const auto &c : data.columns())
            out += sanitize_name(c.name()) + "; ";
        out += "\n";

        for (usize i = 0; i < rows; ++i) {
            for (const auto &c : header.columns())
                out += c.value_string(i) + "; ";
            for (const auto &c : data.columns())
                out += c.value_string(i) + "; ";
            out += "\n";
        }
        return Result<dp::String>::ok(std::move(out));
    }

    inline Result<void> write_csv(const dp::String &path, const timelog::ChannelSet &header,
                                  const timelog::ChannelSet &data) {
        auto text = format_csv(header, data);
        if (!text.is_ok())
            return Result<void>::err(text.error());

        FILE *f = fopen(path.c_str(), "wb");
        if (!f) {
            return Result<void>::err(Error::io("failed to open output file: " + path));
        }
        const auto &body = text.value();
        usize written = fwrite(body.data(), 1, body.size(), f);
        fclose(f);

        if (written != body.size()) {
            return Result<void>::err(Error::io("incomplete write: " + path));
        }

        echo::category("isogml.output").info("wrote ", path, " (", header.rows(), " rows)");
        return {};
    }

} // namespace isogml::output
