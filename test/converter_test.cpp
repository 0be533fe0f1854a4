#include <doctest/doctest.h>
#include <isogml/app/converter.hpp>
#include <isogml/util/bitfield.hpp>

#include <filesystem>
#include <fstream>

using namespace isogml;
using namespace isogml::app;

namespace {

    namespace fs = std::filesystem;

    constexpr const char *TASKDATA = R"(<?xml version="1.0" encoding="UTF-8"?>
<ISO11783_TaskData VersionMajor="4" VersionMinor="2" DataTransferOrigin="1">
  <FRM A="FRM1" B="North Farm"/>
  <PFD A="PFD1" C="Big Field" F="FRM1"/>
  <DVC A="DVC-1" B="Sprayer">
    <DET A="DET-1" B="1" C="1" D="Sprayer" E="0" F="0"/>
    <DET A="DET-2" B="7" C="2" D="GPS" E="1" F="1">
      <DOR A="20"/>
    </DET>
    <DET A="DET-3" B="2" C="3" D="Boom" E="2" F="1">
      <DOR A="21"/>
      <DOR A="22"/>
    </DET>
    <DPT A="20" B="0086" C="800" D="Antenna X"/>
    <DPT A="21" B="0086" C="-4000" D="Boom X"/>
    <DPD A="22" B="0001" C="1" D="8" E="Rate"/>
  </DVC>
  <TSK A="TSK1" B="Spraying" D="FRM1" E="PFD1" G="4">
    <DAN A="1" C="DVC-1"/>
    <TLG A="TLG00001"/>
  </TSK>
</ISO11783_TaskData>
)";

    constexpr const char *TIMELOG_HEADER = R"(<?xml version="1.0" encoding="UTF-8"?>
<TIM A="" D="4">
  <PTN A="" B=""/>
  <DLV A="0001" B="" C="DET-3"/>
</TIM>
)";

    // Two boom sections sharing one designator
    constexpr const char *TWIN_SECTIONS = R"(<?xml version="1.0" encoding="UTF-8"?>
<ISO11783_TaskData VersionMajor="4" VersionMinor="2" DataTransferOrigin="1">
  <FRM A="FRM1" B="North Farm"/>
  <PFD A="PFD1" C="Big Field" F="FRM1"/>
  <DVC A="DVC-1" B="Sprayer">
    <DET A="DET-1" B="1" C="1" D="Sprayer" E="0" F="0"/>
    <DET A="DET-2" B="7" C="2" D="GPS" E="1" F="1">
      <DOR A="20"/>
    </DET>
    <DET A="DET-3" B="4" C="3" D="Section" E="2" F="1">
      <DOR A="21"/>
      <DOR A="23"/>
    </DET>
    <DET A="DET-4" B="4" C="4" D="Section" E="3" F="1">
      <DOR A="22"/>
      <DOR A="24"/>
    </DET>
    <DPT A="20" B="0086" C="800" D="Antenna X"/>
    <DPT A="21" B="0087" C="-1500" D="Left Y"/>
    <DPT A="22" B="0087" C="1500" D="Right Y"/>
    <DPD A="23" B="0001" C="1" D="8" E="Rate"/>
    <DPD A="24" B="0001" C="1" D="8" E="Rate"/>
  </DVC>
  <TSK A="TSK1" B="Spraying" D="FRM1" E="PFD1" G="4">
    <DAN A="1" C="DVC-1"/>
    <TLG A="TLG00001"/>
  </TSK>
</ISO11783_TaskData>
)";

    constexpr const char *TWIN_HEADER = R"(<?xml version="1.0" encoding="UTF-8"?>
<TIM A="" D="4">
  <PTN A="" B=""/>
  <DLV A="0001" B="" C="DET-3"/>
  <DLV A="0001" B="" C="DET-4"/>
</TIM>
)";

    void put_u16(std::ofstream &out, u16 v) {
        u8 buf[2];
        bitfield::pack_u16_le(buf, v);
        out.write(reinterpret_cast<const char *>(buf), 2);
    }

    void put_u32(std::ofstream &out, u32 v) {
        u8 buf[4];
        bitfield::pack_u32_le(buf, v);
        out.write(reinterpret_cast<const char *>(buf), 4);
    }

    // Task directory with one time-log of `rows` records driving north about 1 m apart
    struct TaskDir {
        fs::path path;

        TaskDir(const char *name, usize rows, const char *taskdata = TASKDATA,
                const char *timelog_header = TIMELOG_HEADER)
            : path(fs::temp_directory_path() / name) {
            fs::remove_all(path);
            fs::create_directories(path);
            std::ofstream(path / "TASKDATA.XML") << taskdata;
            std::ofstream(path / "TLG00001.XML") << timelog_header;

            std::ofstream bin(path / "TLG00001.BIN", std::ios::binary);
            for (usize i = 0; i < rows; ++i) {
                put_u32(bin, 28800000 + static_cast<u32>(i) * 1000); // 08:00:00 + i s
                put_u16(bin, 15127);
                put_u32(bin, static_cast<u32>(520000000 + static_cast<i32>(i) * 90));
                put_u32(bin, 50000000);
                if (i == 0) {
                    const char delta[] = {1, 0};
                    bin.write(delta, 2);
                    put_u32(bin, 150);
                } else {
                    bin.put(0);
                }
            }
        }

        ~TaskDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        dp::String task_file() const { return dp::String((path / "TASKDATA.XML").string()); }

        dp::Vector<fs::path> outputs(const char *ext) const {
            dp::Vector<fs::path> found;
            for (const auto &entry : fs::directory_iterator(path)) {
                if (entry.path().extension() == ext)
                    found.push_back(entry.path());
            }
            return found;
        }
    };

    RunOptions options_for(const TaskDir &dir) {
        return RunOptions{}.set_task_file(dir.task_file()).set_output_dir(dp::String(dir.path.string()));
    }

} // namespace

TEST_CASE("Simulated CSV output per geometry record") {
    TaskDir dir("isogml_converter_csv_test", 6);

    Converter converter(options_for(dir).set_format(output::Format::Csv));
    CHECK(converter.run());

    // The boom record carries the rate channel; the original record is always written
    CHECK(converter.files_written() == 2);
    auto files = dir.outputs(".CSV");
    REQUIRE(files.size() == 2);

    bool found_boom = false;
    for (const auto &f : files) {
        auto name = f.filename().string();
        CHECK(name.find("North Farm_Big Field_Spraying_") == 0);
        CHECK(name.find("_08.00.00_TLG00001.CSV") != std::string::npos);
        if (name.find("Sprayer_Boom") != std::string::npos) {
            found_boom = true;
            std::ifstream in(f);
            std::string first;
            std::getline(in, first);
            CHECK(first.find("PositionNorth; PositionEast; PositionUp; ") == 0);
            CHECK(first.find("Sprayer_Boom_Rate; ") != std::string::npos);
            usize lines = 1;
            std::string line;
            while (std::getline(in, line))
                ++lines;
            CHECK(lines == 7);
        }
    }
    CHECK(found_boom);
}

TEST_CASE("Records with the same description get distinct files") {
    TaskDir dir("isogml_converter_twin_test", 4, TWIN_SECTIONS, TWIN_HEADER);

    Converter converter(options_for(dir).set_format(output::Format::Csv));
    CHECK(converter.run());
    CHECK(converter.files_written() == 3);

    auto files = dir.outputs(".CSV");
    REQUIRE(files.size() == 3);
    usize plain = 0;
    usize with_id = 0;
    for (const auto &f : files) {
        auto name = f.filename().string();
        if (name.find("_Sprayer_Section_DET-4_") != std::string::npos)
            ++with_id;
        else if (name.find("_Sprayer_Section_") != std::string::npos)
            ++plain;
    }
    CHECK(plain == 1);
    CHECK(with_id == 1);
}

TEST_CASE("Without simulation only the raw trace is written") {
    TaskDir dir("isogml_converter_raw_test", 4);

    Converter converter(options_for(dir).set_format(output::Format::Csv).set_simulate(false));
    CHECK(converter.run());
    REQUIRE(converter.files_written() == 1);

    auto files = dir.outputs(".CSV");
    REQUIRE(files.size() == 1);
    std::ifstream in(files.front());
    std::string first;
    std::getline(in, first);
    CHECK(first == "TimeStartTOFD; TimeStartDATE; PositionNorth; PositionEast; Sprayer_Boom_Rate; ");
    std::string row;
    std::getline(in, row);
    CHECK(row == "08:00:00; 2021-06-01; 520000000; 50000000; 150; ");
}

TEST_CASE("GML output") {
    TaskDir dir("isogml_converter_gml_test", 5);

    Converter converter(options_for(dir));
    CHECK(converter.run());

    auto files = dir.outputs(".GML");
    REQUIRE(files.size() == 2);
    for (const auto &f : files) {
        pugi::xml_document doc;
        REQUIRE(doc.load_file(f.string().c_str()));
        auto root = doc.child("tnt:FeatureCollection");
        REQUIRE(root);
        usize members = 0;
        for (auto member : root.children("gml:featureMember")) {
            CHECK(member.child("tnt:Spraying_point"));
            ++members;
        }
        CHECK(members == 5);
    }
}

TEST_CASE("Failures make the run unsuccessful") {
    SUBCASE("missing task file") {
        Converter converter(RunOptions{}.set_task_file("/nonexistent/TASKDATA.XML"));
        CHECK_FALSE(converter.run());
        CHECK(converter.files_written() == 0);
    }

    SUBCASE("missing time-log files") {
        TaskDir dir("isogml_converter_missing_test", 3);
        fs::remove(dir.path / "TLG00001.BIN");

        Converter converter(options_for(dir).set_format(output::Format::Csv));
        CHECK_FALSE(converter.run());
        CHECK(converter.files_written() == 0);
    }
}
