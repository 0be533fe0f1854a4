#include <doctest/doctest.h>
#include <isogml/task/loader.hpp>

#include <filesystem>
#include <fstream>

using namespace isogml;
using namespace isogml::task;

namespace {

    namespace fs = std::filesystem;

    constexpr const char *TASKDATA = R"(<?xml version="1.0" encoding="UTF-8"?>
<ISO11783_TaskData VersionMajor="3" VersionMinor="3" DataTransferOrigin="1">
  <FRM A="FRM1" B="North Farm"/>
  <PFD A="PFD1" C="Big Field" F="FRM1"/>
  <XFR A="DVC00001" B="1"/>
  <TSK A="TSK1" B="Spreading" D="FRM1" E="PFD1" G="4">
    <DAN A="1" C="DVC-1"/>
    <DAN A="2" C="DVC-2"/>
    <CNN A="DVC-1" B="DET-2" C="DVC-2" D="DET-12"/>
    <TLG A="TLG00001"/>
    <TLG A="TLG00002"/>
  </TSK>
</ISO11783_TaskData>
)";

    constexpr const char *DEVICES = R"(<?xml version="1.0" encoding="UTF-8"?>
<XFC>
  <DVC A="DVC-1" B="Spreader" D="A00E840000000000">
    <DET A="DET-1" B="1" C="1" D="Spreader" E="0" F="0"/>
    <DET A="DET-2" B="6" C="2" D="Hitch" E="1" F="1">
      <DOR A="20"/>
    </DET>
    <DPT A="20" B="0086" C="3000" D="Offset X"/>
    <DPD A="21" B="0084" C="1" D="8" E="Rate"/>
  </DVC>
  <DVC A="DVC-2" B="Tractor">
    <DET A="DET-10" B="1" C="1" D="Tractor" E="0" F="0"/>
    <DET A="DET-11" B="7" C="2" D="GPS" E="1" F="1"/>
    <DET A="DET-12" B="6" C="3" D="Rear hitch" E="2" F="1"/>
  </DVC>
</XFC>
)";

    constexpr const char *TIMELOG_HEADER = R"(<?xml version="1.0" encoding="UTF-8"?>
<TIM A="" D="4">
  <PTN A="" B="" C="" D="" E="5" G=""/>
  <DLV A="0084" B="" C="DET-1"/>
  <DLV A="0087" B="-250" C="DET-2"/>
</TIM>
)";

    struct TempDir {
        fs::path path;

        explicit TempDir(const char *name) : path(fs::temp_directory_path() / name) {
            fs::remove_all(path);
            fs::create_directories(path);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        void write(const char *file, const char *text) const { std::ofstream(path / file) << text; }
        dp::String file(const char *name) const { return dp::String((path / name).string()); }
    };

} // namespace

TEST_CASE("Load task document with an external device file") {
    TempDir dir("isogml_loader_test");
    dir.write("TASKDATA.XML", TASKDATA);
    dir.write("DVC00001.XML", DEVICES);

    auto r = load_task_document(dir.file("TASKDATA.XML"));
    REQUIRE(r.is_ok());
    const auto &doc = r.value();

    REQUIRE(doc.devices.devices().size() == 2);
    const auto &spreader = doc.devices.devices()[0];
    CHECK(spreader.designator == "Spreader");
    REQUIRE(spreader.elements.size() == 2);
    CHECK(spreader.elements[1].type == DeviceElementType::Connector);
    CHECK(spreader.elements[1].parent_object_id == 1);
    REQUIRE(spreader.elements[1].object_refs.size() == 1);
    CHECK(spreader.elements[1].object_refs[0] == 20);
    REQUIRE(spreader.properties.size() == 1);
    CHECK(spreader.properties[0].ddi == ddi::DEVICE_ELEMENT_OFFSET_X);
    CHECK(spreader.properties[0].value == 3000);
    REQUIRE(spreader.process_data.size() == 1);
    CHECK(spreader.process_data[0].designator == "Rate");
    CHECK(doc.devices.devices()[1].has_navigation());

    REQUIRE(doc.tasks.size() == 1);
    const auto &t = doc.tasks[0];
    CHECK(t.designator == "Spreading");
    CHECK(t.farm == "North Farm");
    CHECK(t.field == "Big Field");
    REQUIRE(t.device_refs.size() == 2);
    CHECK(t.device_refs[1] == "DVC-2");
    REQUIRE(t.connections.size() == 1);
    CHECK(t.connections[0].element0 == "DET-2");
    CHECK(t.connections[0].element1 == "DET-12");
    REQUIRE(t.timelogs.size() == 2);
    CHECK(t.timelogs[0] == "TLG00001");
}

TEST_CASE("External file name case") {
    TempDir dir("isogml_loader_case_test");
    dir.write("TASKDATA.XML", TASKDATA);
    dir.write("DVC00001.xml", DEVICES);

    auto r = load_task_document(dir.file("TASKDATA.XML"));
    REQUIRE(r.is_ok());
    CHECK(r.value().devices.devices().size() == 2);
}

TEST_CASE("Load failures are IoError") {
    SUBCASE("missing task file") {
        auto r = load_task_document("/nonexistent/TASKDATA.XML");
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::IoError);
    }

    SUBCASE("missing external fragment") {
        TempDir dir("isogml_loader_missing_test");
        dir.write("TASKDATA.XML", TASKDATA);
        auto r = load_task_document(dir.file("TASKDATA.XML"));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::IoError);
    }

    SUBCASE("missing binary") {
        auto r = read_binary_file("/nonexistent/TLG00001.BIN");
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::IoError);
    }
}

TEST_CASE("Task without farm or field") {
    pugi::xml_document doc;
    REQUIRE(doc.load_string(R"(<ISO11783_TaskData><TSK A="TSK9" B="Solo"><TLG A="TLG00009"/></TSK></ISO11783_TaskData>)"));
    auto parsed = parse_task_document(doc.document_element(), ".");
    REQUIRE(parsed.tasks.size() == 1);
    CHECK(parsed.tasks[0].farm.empty());
    CHECK(parsed.tasks[0].field.empty());
    CHECK(parsed.tasks[0].device_refs.empty());
}

TEST_CASE("Time-log header document") {
    pugi::xml_document doc;
    REQUIRE(doc.load_string(TIMELOG_HEADER));
    auto schema = parse_timelog_schema(doc.child("TIM"));

    CHECK(schema.time_start_declared);
    REQUIRE(schema.positions.size() == 1);
    // E carries a fixed value and is not logged
    dp::Vector<char> expected = {'A', 'B', 'C', 'D', 'G'};
    CHECK(schema.positions[0].slots == expected);

    REQUIRE(schema.values.size() == 2);
    CHECK(schema.values[0].ddi_text == "0084");
    CHECK(schema.values[0].literal.empty());
    CHECK(schema.values[1].element == "DET-2");
    CHECK(schema.values[1].literal == "-250");

    SUBCASE("time stamp with a fixed value is not logged") {
        pugi::xml_document fixed;
        REQUIRE(fixed.load_string(R"(<TIM A="2021-06-01T08:00:00" D="4"><PTN A="" B=""/></TIM>)"));
        CHECK_FALSE(parse_timelog_schema(fixed.child("TIM")).time_start_declared);
    }
}

TEST_CASE("Binary time-log is read whole") {
    TempDir dir("isogml_loader_bin_test");
    {
        std::ofstream out(dir.path / "TLG00001.BIN", std::ios::binary);
        const char bytes[] = {0x01, 0x02, 0x03};
        out.write(bytes, sizeof(bytes));
    }
    auto r = read_binary_file(dir.file("TLG00001.BIN"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 3);
    CHECK(r.value()[2] == 0x03);
}
