#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../timelog/channel.hpp"
#include "naming.hpp"
#include <algorithm>
#include <cstdio>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <pugixml.hpp>

namespace isogml::output {

    inline constexpr const char *GML_NAMESPACE = "http://www.opengis.net/gml";
    inline constexpr const char *TNT_NAMESPACE = "http://www.microimages.com/TNT";
    inline constexpr const char *GML_SRS = "EPSG:4326";

    namespace detail {

        inline dp::String format_coordinate(f64 v) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.7f", v);
            return dp::String(buf);
        }

        inline dp::String format_height(f64 v) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.3f", v);
            return dp::String(buf);
        }

        inline void append_text(pugi::xml_node parent, const dp::String &name, const dp::String &text) {
            parent.append_child(name.c_str()).text().set(text.c_str());
        }

    } // namespace detail

    // ─── GML point features ──────────────────────────────────────────────────────
    // A tnt:FeatureCollection holding one <task>_point feature per row. Header
    // positions are geodetic fixed point (1e-7 deg, 1e-3 m); PositionUp is optional.
    inline Result<void> build_gml(pugi::xml_document &doc, const dp::String &task_name,
                                  const timelog::ChannelSet &header, const timelog::ChannelSet &data) {
        const auto *north_col = header.find(channel::POSITION_NORTH);
        const auto *east_col = header.find(channel::POSITION_EAST);
        const auto *up_col = header.find(channel::POSITION_UP);
        const auto *north = north_col ? north_col->as_i32() : nullptr;
        const auto *east = east_col ? east_col->as_i32() : nullptr;
        const auto *up = up_col ? up_col->as_i32() : nullptr;
        if (!north || !east) {
            return Result<void>::err(Error::invalid_argument("GML output needs PositionNorth and PositionEast"));
        }

        const usize rows = header.rows();
        if (!header.uniform() || !data.uniform() || (!data.empty() && data.rows() != rows)) {
            return Result<void>::err(Error::invalid_argument("GML channels have unequal row counts"));
        }

        auto root = doc.append_child("tnt:FeatureCollection");
        root.append_attribute("xmlns:tnt") = TNT_NAMESPACE;
        root.append_attribute("xmlns:gml") = GML_NAMESPACE;

        auto bounds = root.append_child("gml:boundedBy");
        bounds.append_attribute("srsName") = GML_SRS;
        if (rows > 0) {
            auto [lat_min, lat_max] = std::minmax_element(north->begin(), north->end());
            auto [lon_min, lon_max] = std::minmax_element(east->begin(), east->end());
            dp::String box = detail::format_coordinate(*lon_min * LAT_LON_RESOLUTION) + "," +
                             detail::format_coordinate(*lat_min * LAT_LON_RESOLUTION) + " " +
                             detail::format_coordinate(*lon_max * LAT_LON_RESOLUTION) + "," +
                             detail::format_coordinate(*lat_max * LAT_LON_RESOLUTION);
            detail::append_text(bounds, "gml:coordinates", box);
        }

        dp::String feature = "tnt:" + sanitize_name(task_name) + "_point";
        for (usize i = 0; i < rows; ++i) {
            auto point = root.append_child("gml:featureMember").append_child(feature.c_str());

            for (const auto &c : header.columns()) {
                if (c.name() == channel::POSITION_NORTH || c.name() == channel::POSITION_EAST ||
                    c.name() == channel::POSITION_UP)
                    continue;
                detail::append_text(point, "tnt:" + sanitize_name(c.name()), c.value_string(i));
            }
            for (const auto &c : data.columns())
                detail::append_text(point, "tnt:" + sanitize_name(c.name()), c.value_string(i));

            f64 height = (up && i < up->size()) ? (*up)[i] * HEIGHT_RESOLUTION : 0.0;
            dp::String coordinates = detail::format_coordinate((*east)[i] * LAT_LON_RESOLUTION) + "," +
                                     detail::format_coordinate((*north)[i] * LAT_LON_RESOLUTION) + "," +
                                     detail::format_height(height);

            auto gml_point = point.append_child("tnt:_POINT_").append_child("gml:Point");
            gml_point.append_attribute("srsName") = GML_SRS;
            detail::append_text(gml_point, "gml:coordinates", coordinates);
        }
        return {};
    }

    inline Result<void> write_gml(const dp::String &path, const dp::String &task_name,
                                  const timelog::ChannelSet &header, const timelog::ChannelSet &data) {
        pugi::xml_document doc;
        auto built = build_gml(doc, task_name, header, data);
        if (!built.is_ok())
            return built;

        if (!doc.save_file(path.c_str(), "  ")) {
            return Result<void>::err(Error::io("failed to write output file: " + path));
        }

        echo::category("isogml.output").info("wrote ", path, " (", header.rows(), " features)");
        return {};
    }

} // namespace isogml::output
