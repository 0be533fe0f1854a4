#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "isogml/core/constants.hpp"
#include "isogml/core/dynamic_ref.hpp"
#include "isogml/core/error.hpp"
#include "isogml/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "isogml/util/bitfield.hpp"
#include "isogml/util/byte_reader.hpp"
#include "isogml/util/parse.hpp"

// ─── Geodesy ─────────────────────────────────────────────────────────────────
#include "isogml/geo/transforms.hpp"

// ─── Task data ───────────────────────────────────────────────────────────────
#include "isogml/task/device_description.hpp"
#include "isogml/task/loader.hpp"
#include "isogml/task/task_data.hpp"

// ─── Time-log ────────────────────────────────────────────────────────────────
#include "isogml/timelog/channel.hpp"
#include "isogml/timelog/decoder.hpp"
#include "isogml/timelog/schema.hpp"

// ─── Geometry ────────────────────────────────────────────────────────────────
#include "isogml/geometry/point3.hpp"
#include "isogml/geometry/record.hpp"
#include "isogml/geometry/resolver.hpp"

// ─── Simulation ──────────────────────────────────────────────────────────────
#include "isogml/sim/heading.hpp"
#include "isogml/sim/trajectory.hpp"

// ─── Output ──────────────────────────────────────────────────────────────────
#include "isogml/output/csv_writer.hpp"
#include "isogml/output/gml_writer.hpp"
#include "isogml/output/naming.hpp"

// ─── Application ─────────────────────────────────────────────────────────────
#include "isogml/app/converter.hpp"
#include "isogml/app/options.hpp"
