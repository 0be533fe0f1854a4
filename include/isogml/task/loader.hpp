#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../timelog/schema.hpp"
#include "../util/parse.hpp"
#include "device_description.hpp"
#include "task_data.hpp"
#include <cctype>
#include <cstdio>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <filesystem>
#include <pugixml.hpp>

namespace isogml::task {

    namespace detail {

        template <typename Fn> void for_each_descendant(const pugi::xml_node &node, const char *name, Fn &&fn) {
            for (auto child : node.children()) {
                if (std::strcmp(child.name(), name) == 0)
                    fn(child);
                for_each_descendant(child, name, fn);
            }
        }

        inline dp::String attr(const pugi::xml_node &node, const char *key) {
            return dp::String(node.attribute(key).as_string());
        }

        // Attribute present with an empty value: "logged per record" in TIM/PTN
        inline bool declared_empty(const pugi::xml_node &node, const char *key) {
            auto a = node.attribute(key);
            return a && a.value()[0] == '\0';
        }

        // ISOXML file names are upper case on the controller; accept either case
        inline dp::Optional<dp::String> sibling_file(const dp::String &directory, const dp::String &base,
                                                     const char *ext_upper) {
            namespace fs = std::filesystem;
            dp::String ext_lower;
            for (const char *c = ext_upper; *c; ++c)
                ext_lower += static_cast<char>(std::tolower(static_cast<unsigned char>(*c)));

            for (const auto &ext : {dp::String(ext_upper), ext_lower}) {
                fs::path p = fs::path(directory.c_str()) / (base + ext).c_str();
                std::error_code ec;
                if (fs::exists(p, ec))
                    return dp::String(p.string());
            }
            return dp::nullopt;
        }

        inline Result<void> load_xml(pugi::xml_document &doc, const dp::String &path) {
            pugi::xml_parse_result parsed = doc.load_file(path.c_str());
            if (!parsed) {
                return Result<void>::err(Error::io("cannot load " + path + ": " + dp::String(parsed.description())));
            }
            return {};
        }

        inline DeviceElement parse_element(const pugi::xml_node &det) {
            DeviceElement e;
            e.id = attr(det, "A");
            e.type = static_cast<DeviceElementType>(det.attribute("B").as_uint(0));
            e.object_id = static_cast<ObjectID>(det.attribute("C").as_uint(0));
            e.designator = attr(det, "D");
            e.number = static_cast<ElementNumber>(det.attribute("E").as_uint(0));
            e.parent_object_id = static_cast<ObjectID>(det.attribute("F").as_uint(0));
            for (auto dor : det.children("DOR"))
                e.object_refs.push_back(static_cast<ObjectID>(dor.attribute("A").as_uint(0)));
            return e;
        }

        inline Device parse_device(const pugi::xml_node &dvc) {
            Device d;
            d.id = attr(dvc, "A");
            d.designator = attr(dvc, "B");

            for (auto det : dvc.children("DET"))
                d.elements.push_back(parse_element(det));

            for (auto dpd : dvc.children("DPD")) {
                auto ddi = parse_ddi(attr(dpd, "B"));
                if (!ddi.is_ok()) {
                    echo::category("isogml.task").warn("DPD in ", d.id, " skipped: ", ddi.error().message);
                    continue;
                }
                ProcessDataDefinition pd;
                pd.object_id = static_cast<ObjectID>(dpd.attribute("A").as_uint(0));
                pd.ddi = ddi.value();
                pd.designator = attr(dpd, "E");
                d.process_data.push_back(std::move(pd));
            }

            for (auto dpt : dvc.children("DPT")) {
                auto ddi = parse_ddi(attr(dpt, "B"));
                if (!ddi.is_ok()) {
                    echo::category("isogml.task").warn("DPT in ", d.id, " skipped: ", ddi.error().message);
                    continue;
                }
                PropertyDefinition pt;
                pt.object_id = static_cast<ObjectID>(dpt.attribute("A").as_uint(0));
                pt.ddi = ddi.value();
                auto value = parse_i32(attr(dpt, "C"));
                if (value.is_ok()) {
                    pt.value = value.value();
                } else {
                    echo::category("isogml.task").warn("DPT value in ", d.id, ": ", value.error().message, ", using 0");
                }
                pt.designator = attr(dpt, "D");
                d.properties.push_back(std::move(pt));
            }
            return d;
        }

        inline dp::String lookup_attr(const pugi::xml_node &root, const char *tag, const dp::String &id,
                                      const char *key) {
            dp::String value;
            usize matches = 0;
            for_each_descendant(root, tag, [&](const pugi::xml_node &n) {
                if (attr(n, "A") == id) {
                    value = attr(n, key);
                    ++matches;
                }
            });
            if (matches != 1 && !id.empty()) {
                echo::category("isogml.task").warn(Error::not_unique(dp::String(tag) + " " + id, matches).message);
            }
            return value;
        }

        inline Task parse_task(const pugi::xml_node &root, const pugi::xml_node &tsk) {
            Task t;
            t.id = attr(tsk, "A");
            t.designator = attr(tsk, "B");
            t.farm = lookup_attr(root, "FRM", attr(tsk, "D"), "B");
            t.field = lookup_attr(root, "PFD", attr(tsk, "E"), "C");

            for (auto dan : tsk.children("DAN"))
                t.device_refs.push_back(attr(dan, "C"));

            for (auto cnn : tsk.children("CNN")) {
                t.connections.push_back(Connection{attr(cnn, "A"), attr(cnn, "B"), attr(cnn, "C"), attr(cnn, "D")});
            }

            for_each_descendant(tsk, "TLG", [&](const pugi::xml_node &tlg) { t.timelogs.push_back(attr(tlg, "A")); });
            return t;
        }

    } // namespace detail

    // ─── Task document (ISO 11783-10 TASKDATA) ───────────────────────────────────

    // Builds the model from an already merged document
    inline TaskDocument parse_task_document(const pugi::xml_node &root, dp::String directory) {
        TaskDocument doc;
        doc.directory = std::move(directory);

        detail::for_each_descendant(root, "DVC",
                                    [&](const pugi::xml_node &dvc) { doc.devices.add_device(detail::parse_device(dvc)); });
        detail::for_each_descendant(root, "TSK", [&](const pugi::xml_node &tsk) {
            doc.tasks.push_back(detail::parse_task(root, tsk));
        });

        echo::category("isogml.task")
            .debug("parsed ", doc.devices.devices().size(), " devices, ", doc.tasks.size(), " tasks");
        return doc;
    }

    // Appends the children of every externally referenced XFC fragment (XFR) to the
    // root and drops the XFR nodes.
    inline Result<void> merge_external_files(pugi::xml_node root, const dp::String &directory) {
        dp::Vector<pugi::xml_node> references;
        detail::for_each_descendant(root, "XFR", [&](const pugi::xml_node &xfr) { references.push_back(xfr); });

        for (auto &xfr : references) {
            dp::String base = detail::attr(xfr, "A");
            auto path = detail::sibling_file(directory, base, ".XML");
            if (!path.has_value()) {
                return Result<void>::err(Error::io("external file not found: " + base));
            }

            pugi::xml_document fragment;
            auto loaded = detail::load_xml(fragment, *path);
            if (!loaded.is_ok())
                return loaded;

            auto xfc = fragment.child("XFC");
            for (auto child : xfc.children())
                root.append_copy(child);

            echo::category("isogml.task").debug("merged external file ", *path);
            xfr.parent().remove_child(xfr);
        }
        return {};
    }

    inline Result<TaskDocument> load_task_document(const dp::String &path) {
        pugi::xml_document doc;
        auto loaded = detail::load_xml(doc, path);
        if (!loaded.is_ok())
            return Result<TaskDocument>::err(loaded.error());

        dp::String directory(std::filesystem::path(path.c_str()).parent_path().string());
        auto root = doc.document_element();

        auto merged = merge_external_files(root, directory);
        if (!merged.is_ok())
            return Result<TaskDocument>::err(merged.error());

        echo::category("isogml.task").info("loaded task file ", path);
        return Result<TaskDocument>::ok(parse_task_document(root, directory));
    }

    // ─── Time-log header document (TIM) ──────────────────────────────────────────

    inline timelog::TimelogSchema parse_timelog_schema(const pugi::xml_node &tim) {
        static constexpr char SLOTS[] = {'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I'};

        timelog::TimelogSchema schema;
        // Attributes B and C (stop, duration) are not logged in a TLG
        schema.time_start_declared = detail::declared_empty(tim, "A");

        detail::for_each_descendant(tim, "PTN", [&](const pugi::xml_node &ptn) {
            timelog::PositionTemplate pos;
            for (char slot : SLOTS) {
                const char key[2] = {slot, '\0'};
                if (detail::declared_empty(ptn, key))
                    pos.add_slot(slot);
            }
            schema.positions.push_back(std::move(pos));
        });

        detail::for_each_descendant(tim, "DLV", [&](const pugi::xml_node &dlv) {
            schema.values.push_back(
                timelog::LoggedValue{detail::attr(dlv, "A"), detail::attr(dlv, "B"), detail::attr(dlv, "C")});
        });
        return schema;
    }

    inline Result<timelog::TimelogSchema> load_timelog_schema(const dp::String &path) {
        pugi::xml_document doc;
        auto loaded = detail::load_xml(doc, path);
        if (!loaded.is_ok())
            return Result<timelog::TimelogSchema>::err(loaded.error());

        auto tim = doc.child("TIM");
        if (!tim) {
            return Result<timelog::TimelogSchema>::err(Error::schema_mismatch("no TIM root in " + path));
        }
        return Result<timelog::TimelogSchema>::ok(parse_timelog_schema(tim));
    }

    // ─── Binary time-log ─────────────────────────────────────────────────────────
    inline Result<dp::Vector<u8>> read_binary_file(const dp::String &filepath) {
        FILE *f = fopen(filepath.c_str(), "rb");
        if (!f) {
            return Result<dp::Vector<u8>>::err(Error::io("failed to open binary file: " + filepath));
        }

        fseek(f, 0, SEEK_END);
        isize size = static_cast<isize>(ftell(f));
        fseek(f, 0, SEEK_SET);

        if (size < 0) {
            fclose(f);
            return Result<dp::Vector<u8>>::err(Error::io("cannot size binary file: " + filepath));
        }

        dp::Vector<u8> data(static_cast<usize>(size));
        usize read = size > 0 ? fread(data.data(), 1, static_cast<usize>(size), f) : 0;
        fclose(f);

        if (read != static_cast<usize>(size)) {
            return Result<dp::Vector<u8>>::err(Error::io("incomplete read: " + filepath));
        }

        echo::category("isogml.task").debug("read binary file ", filepath, " (", size, " bytes)");
        return Result<dp::Vector<u8>>::ok(std::move(data));
    }

} // namespace isogml::task
