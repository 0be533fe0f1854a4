#include <doctest/doctest.h>
#include <isogml/task/device_description.hpp>

using namespace isogml;
using namespace isogml::task;

namespace {

    Device seeder() {
        Device d;
        d.set_id("DVC-1").set_designator("Seeder");
        d.add_element(DeviceElement{}.set_id("DET-1").set_type(DeviceElementType::Device).set_object_id(1));
        d.add_element(DeviceElement{}
                          .set_id("DET-2")
                          .set_type(DeviceElementType::Section)
                          .set_object_id(2)
                          .set_designator("Row 1")
                          .set_parent(1)
                          .add_ref(20)
                          .add_ref(21));
        d.add_process_data(ProcessDataDefinition{20, ddi::DEVICE_ELEMENT_OFFSET_Y, "Offset Y"});
        d.add_property(PropertyDefinition{21, ddi::DEVICE_ELEMENT_OFFSET_X, -1200, "Offset X"});
        return d;
    }

} // namespace

TEST_CASE("DeviceDescription lookups") {
    DeviceDescription graph;
    graph.add_device(seeder());

    SUBCASE("find device and element") {
        auto dev = graph.find_device("DVC-1");
        REQUIRE(dev.is_ok());
        CHECK(dev.value()->designator == "Seeder");

        auto el = graph.find_element("DET-2");
        REQUIRE(el.is_ok());
        CHECK(el.value().device->id == "DVC-1");
        CHECK(el.value().element->designator == "Row 1");
    }

    SUBCASE("missing id is a SchemaMismatch") {
        auto dev = graph.find_device("DVC-7");
        REQUIRE_FALSE(dev.is_ok());
        CHECK(dev.error().code == ErrorCode::SchemaMismatch);
        CHECK_FALSE(graph.find_element("DET-7").is_ok());
    }

    SUBCASE("duplicate ids are ambiguous") {
        graph.add_device(seeder());
        CHECK_FALSE(graph.find_device("DVC-1").is_ok());
        CHECK_FALSE(graph.find_element("DET-2").is_ok());
    }
}

TEST_CASE("Root element") {
    DeviceDescription graph;
    auto d = seeder();

    auto root = graph.root_element(d);
    REQUIRE(root.is_ok());
    CHECK(root.value()->id == "DET-1");

    SUBCASE("falls back to the element without a parent") {
        Device plain;
        plain.set_id("DVC-2");
        plain.add_element(DeviceElement{}.set_id("DET-5").set_type(DeviceElementType::Function));
        plain.add_element(DeviceElement{}.set_id("DET-6").set_type(DeviceElementType::Section).set_parent(5));
        auto r = graph.root_element(plain);
        REQUIRE(r.is_ok());
        CHECK(r.value()->id == "DET-5");
    }
}

TEST_CASE("Process data and property lookup through object references") {
    DeviceDescription graph;
    graph.add_device(seeder());
    auto ref = graph.find_element("DET-2").value();

    auto pd = graph.process_data_for(ref, ddi::DEVICE_ELEMENT_OFFSET_Y);
    REQUIRE(pd.is_ok());
    REQUIRE(pd.value() != nullptr);
    CHECK(pd.value()->designator == "Offset Y");

    auto none = graph.process_data_for(ref, ddi::DEVICE_ELEMENT_OFFSET_X);
    REQUIRE(none.is_ok());
    CHECK(none.value() == nullptr);

    auto pt = graph.property_for(ref, ddi::DEVICE_ELEMENT_OFFSET_X);
    REQUIRE(pt.is_ok());
    REQUIRE(pt.value() != nullptr);
    CHECK(pt.value()->value == -1200);

    SUBCASE("root has no references") {
        auto root = graph.find_element("DET-1").value();
        CHECK(graph.property_for(root, ddi::DEVICE_ELEMENT_OFFSET_X).value() == nullptr);
    }
}

TEST_CASE("Element description") {
    DeviceDescription graph;
    graph.add_device(seeder());
    CHECK(DeviceDescription::describe(graph.find_element("DET-2").value()) == "Seeder_Row 1");
    CHECK(DeviceDescription::describe(graph.find_element("DET-1").value()) == "Seeder_DET-1");
}
