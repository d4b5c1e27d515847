// test_decoder_pdz25.cpp – End-to-end decoding of hand-crafted pdz25 files.
//
//   cmake -B build && cmake --build build
//   ./build/test_decoder_pdz25

#include "PDZReader/Decoder.hpp"
#include "PDZReader/Dialect.hpp"
#include "PDZReader/FileReader.hpp"
#include "PDZReader/Log.hpp"
#include "PDZReader/SchemaLoader.hpp"
#include "PdzBuilder.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace pdz;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

// ─── Record payload builders ─────────────────────────────────────────────────

static PdzBuilder fileHeader() {
    PdzBuilder b;
    b.wtext(u"PDZ25", 5).u32(3);
    return b;
}

// Record 3 "XRF Spectrum" with the given phase and channel counts.
static PdzBuilder xrfSpectrum(uint32_t phase, const std::vector<uint32_t>& counts) {
    PdzBuilder b;
    b.u32(phase)
     .u32(150000).u32(140000).u32(139000).u32(12)            // raw / valid / in range / resets
     .f32(30.5f).f32(29.0f).f32(1.25f).f32(0.25f).f32(27.5f) // trigger / packet / dead / reset / live
     .f32(40.0f).f32(25.5f)                                  // tube kV / µA
     .i16(13).i16(25).i16(22).i16(50).i16(0).i16(0)          // filters
     .i16(2)                                                 // filter_wheel_number
     .f32(-25.0f).f32(31.5f)                                 // detector / ambient temp
     .i32(-1)                                                // vacuum
     .f32(20.0f)                                             // ev_per_channel
     .i16(1)                                                 // gain_drift_algorithm
     .f32(0.0f)                                              // channel_start
     .systemTime(2024, 2, 29, 13, 45, 7, 4, 120)
     .f32(1013.25f)                                          // atmospheric_pressure
     .i16(static_cast<int16_t>(counts.size()))               // channels
     .i16(35).i16(1)                                         // nose_temp / environment
     .lenText(u"Main")                                       // illumination
     .i16(0);                                                // normal_packet_start
    for (uint32_t c : counts)
        b.u32(c);
    return b;
}

static PdzBuilder pdz25File(std::initializer_list<std::pair<uint16_t, PdzBuilder>> blocks) {
    PdzBuilder file;
    file.block(25, fileHeader());
    for (const auto& [type, payload] : blocks)
        file.block(type, payload);
    return file;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: header + one spectrum
// ─────────────────────────────────────────────────────────────────────────────
static void testSingleSpectrum(const Decoder& decoder) {
    std::cout << "\n=== Test: Header and one XRF Spectrum ===\n";

    PdzBuilder file = pdz25File({{3, xrfSpectrum(1, {10, 20, 30, 40})}});
    hexdump(file.data(), "pdz25");

    ParsedDocument doc = decoder.decode(file.data());
    CHECK(doc.dialect() == Dialect::PDZ25, "dialect = pdz25");
    CHECK(doc.size() == 2, "2 distinct records");
    CHECK(doc.names() == (std::vector<std::string>{"File Header", "XRF Spectrum"}),
          "records in framing order");

    const DecodedFields& hdr = doc.fields("File Header");
    CHECK(hdr.get<std::string>("file_type_id") == "PDZ25", "file_type_id = PDZ25");
    CHECK(hdr.get<uint64_t>("instrument_type") == 3,       "instrument_type = 3");

    CHECK(!doc.isMultiPhase("XRF Spectrum"), "single spectrum is not a sequence");
    const DecodedFields& s = doc.fields("XRF Spectrum");
    CHECK(s.get<uint64_t>("phase_number") == 1,          "phase_number = 1");
    CHECK(s.get<uint64_t>("raw_counts") == 150000,       "raw_counts = 150000");
    CHECK(s.get<float>("tube_voltage") == 40.0f,         "tube_voltage = 40");
    CHECK(s.get<int64_t>("vacuum") == -1,                "vacuum = -1");
    CHECK(s.get<int64_t>("channels") == 4,               "channels = 4");
    CHECK(s.get<std::string>("illumination") == "Main",  "illumination = Main");
    CHECK(s.get<Timestamp>("acquisition_date_time").text == "2024-02-29 13:45:07",
          "acquisition_date_time = 2024-02-29 13:45:07");
    CHECK(s.get<std::vector<uint32_t>>("spectrum_data") ==
              (std::vector<uint32_t>{10, 20, 30, 40}),
          "spectrum_data = [10,20,30,40]");

    const auto* filters = s.getIf<std::vector<DecodedFields>>("filters");
    CHECK(filters && filters->size() == 3, "3 filters");
    if (filters && filters->size() == 3)
        CHECK((*filters)[1].get<int64_t>("filter_thickness") == 50, "filter[1].thickness = 50");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: multi-phase aggregation
// ─────────────────────────────────────────────────────────────────────────────
static void testMultiPhase(const Decoder& decoder) {
    std::cout << "\n=== Test: Multi-phase spectra ===\n";

    PdzBuilder file = pdz25File({{3, xrfSpectrum(1, {1, 2})},
                                 {3, xrfSpectrum(2, {3, 4, 5})},
                                 {3, xrfSpectrum(3, {})}});

    ParsedDocument doc = decoder.decode(file.data());
    CHECK(doc.isMultiPhase("XRF Spectrum"), "XRF Spectrum is a sequence");

    auto phases = doc.occurrences("XRF Spectrum");
    CHECK(phases.size() == 3, "3 phases");
    if (phases.size() == 3) {
        CHECK(phases[0].get<uint64_t>("phase_number") == 1, "phase[0] = 1");
        CHECK(phases[1].get<uint64_t>("phase_number") == 2, "phase[1] = 2");
        CHECK(phases[1].get<std::vector<uint32_t>>("spectrum_data").size() == 3,
              "phase[1] has 3 channels");
        CHECK(phases[2].get<std::vector<uint32_t>>("spectrum_data").empty(),
              "phase[2] has no channels");
    }

    CHECK(doc.occurrences("File Header").size() == 1, "single record yields one occurrence");

    bool threw = false;
    try {
        (void)doc.fields("XRF Spectrum");
    } catch (const std::logic_error&) {
        threw = true;
    }
    CHECK(threw, "fields() on a multi-phase record throws");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: truncated file keeps earlier records
// ─────────────────────────────────────────────────────────────────────────────
static void testTruncatedFile(const Decoder& decoder) {
    std::cout << "\n=== Test: Truncated file ===\n";

    PdzBuilder file = pdz25File({{3, xrfSpectrum(1, {7, 8})}});
    // Third block declares 100 bytes (less than the file) but only 10 follow
    file.u16(3).u32(100).zeros(10);

    FrameResult fr = decoder.frame(file.data());
    CHECK(fr.records.size() == 2, "2 blocks framed before the truncated one");
    CHECK(fr.error == DecodeError::InsufficientBytes, "framing stop reported");

    ParsedDocument doc = decoder.decode(file.data());
    CHECK(doc.size() == 2, "header and first spectrum decoded");
    CHECK(!doc.isMultiPhase("XRF Spectrum"), "truncated block not aggregated");
    CHECK(doc.fields("XRF Spectrum").get<std::vector<uint32_t>>("spectrum_data") ==
              (std::vector<uint32_t>{7, 8}),
          "first spectrum intact");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: unknown record types
// ─────────────────────────────────────────────────────────────────────────────
static void testUnknownRecord(const Decoder& decoder) {
    std::cout << "\n=== Test: Unknown record type ===\n";

    PdzBuilder opaque;
    opaque.u32(0xCAFEBABE).u32(1);
    PdzBuilder file = pdz25File({{4242, opaque}});

    ParsedDocument doc = decoder.decode(file.data());
    CHECK(doc.contains("Unknown Record Type 4242"), "synthesized record name");
    CHECK(doc.fields("Unknown Record Type 4242").empty(), "unknown record decodes to no fields");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: record shorter than its schema
// ─────────────────────────────────────────────────────────────────────────────
static void testPartialRecord(const Decoder& decoder) {
    std::cout << "\n=== Test: Partial record ===\n";

    // GPS Details cut after the latitude and half the longitude
    PdzBuilder gps;
    gps.i32(1).f64(48.8566).u32(0);

    ParsedDocument doc = decoder.decode(pdz25File({{138, gps}}).data());
    const DecodedFields& g = doc.fields("GPS Details");
    CHECK(g.get<int64_t>("gps_valid") == 1,      "gps_valid = 1");
    CHECK(g.get<double>("latitude") == 48.8566,  "latitude = 48.8566");
    CHECK(!g.contains("longitude"),              "longitude missing (4 of 8 bytes)");
    CHECK(!g.contains("altitude"),               "altitude missing");
    CHECK(g.size() == 2,                         "2 fields kept");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: grade results with a fixed and a counted group
// ─────────────────────────────────────────────────────────────────────────────
static void testGradeResults(const Decoder& decoder) {
    std::cout << "\n=== Test: Grade ID Results ===\n";

    PdzBuilder grades;
    grades.lenText(u"316").f32(0.9f)
          .lenText(u"304").f32(0.4f)
          .lenText(u"").f32(0.0f)
          .f32(0.2f)            // match_spread_threshold
          .i16(1).i16(0)        // process_tramp_elements / nominal_chemistry
          .u16(2)               // num_grade_libs
          .lenText(u"Stainless.lib").u32(3)   // version text is never read
          .lenText(u"Nickel.lib").u32(3);

    ParsedDocument doc = decoder.decode(pdz25File({{7, grades}}).data());
    const DecodedFields& r = doc.fields("Grade ID Results");

    const auto* g = r.getIf<std::vector<DecodedFields>>("grades");
    CHECK(g && g->size() == 3, "always 3 grades");
    if (g && g->size() == 3) {
        CHECK((*g)[0].get<std::string>("grade_id") == "316", "grade[0] = 316");
        CHECK((*g)[0].get<float>("confidence") == 0.9f,      "grade[0] confidence 0.9");
        CHECK((*g)[2].get<std::string>("grade_id").empty(),  "grade[2] empty id");
    }
    CHECK(r.get<float>("match_spread_threshold") == 0.2f, "match_spread_threshold = 0.2");
    CHECK(r.get<uint64_t>("num_grade_libs") == 2,         "num_grade_libs = 2");

    const auto* libs = r.getIf<std::vector<DecodedFields>>("grade_libraries");
    CHECK(libs && libs->size() == 2, "2 grade libraries");
    if (libs && libs->size() == 2) {
        CHECK((*libs)[1].get<std::string>("grade_lib_file_name") == "Nickel.lib",
              "library[1] = Nickel.lib");
        CHECK((*libs)[0].get<uint64_t>("grade_lib_ver_length") == 3, "library[0] ver_length = 3");
        CHECK((*libs)[0].get<std::string>("grade_lib_version").empty() &&
                  (*libs)[1].get<std::string>("grade_lib_version").empty(),
              "grade_lib_version reads no length sibling -> empty");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 7: image blob
// ─────────────────────────────────────────────────────────────────────────────
static void testImages(const Decoder& decoder) {
    std::cout << "\n=== Test: Image Details ===\n";

    PdzBuilder images;
    images.i32(1)
          .u32(6).bytes({0xFF, 0xD8, 0x00, 0x01, 0xFF, 0xD9})
          .u32(640).u32(480)
          .lenText(u"spot");

    ParsedDocument doc = decoder.decode(pdz25File({{137, images}}).data());
    const auto* imgs = doc.fields("Image Details").getIf<std::vector<DecodedFields>>("images");
    CHECK(imgs && imgs->size() == 1, "1 image");
    if (imgs && imgs->size() == 1) {
        const DecodedFields& img = (*imgs)[0];
        CHECK(img.get<Bytes>("image").size() == 6,          "image blob 6 bytes");
        CHECK(img.get<Bytes>("image").front() == 0xFF,      "JPEG SOI preserved");
        CHECK(img.get<uint64_t>("x_dimension") == 640,      "x_dimension = 640");
        CHECK(img.get<std::string>("annotation") == "spot", "annotation = spot");
    }

    // num_images = 0 → no "images" entry at all
    PdzBuilder none;
    none.i32(0);
    doc = decoder.decode(pdz25File({{137, none}}).data());
    CHECK(!doc.fields("Image Details").contains("images"), "zero images -> group omitted");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 8: schema quirks kept as authored
// ─────────────────────────────────────────────────────────────────────────────
static void testQuirks(const Decoder& decoder) {
    std::cout << "\n=== Test: Schema quirks ===\n";

    // 1002 repeats grade_ids on num_elements, which it never declares
    PdzBuilder libs;
    libs.u16(2)                      // num_grade_ids
        .f32(0.75f)                  // match_spread_threshold
        .u16(1)                      // num_grade_libs
        .lenText(u"a.lib").u32(1);  // ver_length, no version text

    ParsedDocument doc = decoder.decode(pdz25File({{1002, libs}}).data());
    const DecodedFields& r = doc.fields("Libs Grade ID Results");
    CHECK(!r.contains("grade_ids"),                     "grade_ids omitted");
    CHECK(r.get<float>("match_spread_threshold") == 0.75f, "next field read right after num_grade_ids");
    const auto* gl = r.getIf<std::vector<DecodedFields>>("grade_libs");
    CHECK(gl && gl->size() == 1, "1 grade library");
    if (gl && gl->size() == 1) {
        CHECK((*gl)[0].get<std::string>("file_name") == "a.lib", "file_name = a.lib");
        CHECK((*gl)[0].get<uint64_t>("ver_length") == 1,       "ver_length = 1");
        CHECK((*gl)[0].get<std::string>("version").empty(),    "version looks for version_length -> empty");
    }

    // 5: cal_file_name looks for cal_file_name_length, which is not declared
    PdzBuilder calc;
    calc.u32(1).u32(2).i16(0).i16(1).u16(2)
        .u32(0)                      // cal_file_length
        .lenText(u"Alloy")           // cal_pkg_name
        .u32(0)                      // cal_pkg_pn_length
        .lenText(u"Std");            // type_std_set_name

    doc = decoder.decode(pdz25File({{5, calc}}).data());
    const DecodedFields& c = doc.fields("Calculated Results");
    CHECK(c.get<std::string>("cal_file_name").empty(),       "cal_file_name empty");
    CHECK(c.get<std::string>("cal_pkg_name") == "Alloy",     "cal_pkg_name = Alloy");
    CHECK(c.get<std::string>("cal_pkg_part_number").empty(), "cal_pkg_part_number empty");
    CHECK(c.get<std::string>("type_std_set_name") == "Std",  "type_std_set_name = Std");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 9: LIBS sample with float pairs
// ─────────────────────────────────────────────────────────────────────────────
static void testLibsSample(const Decoder& decoder) {
    std::cout << "\n=== Test: Libs Alloy Sample ===\n";

    PdzBuilder s;
    s.u64(77)
     .lenText(u"Coupon A").lenText(u"BC-001")
     .systemTime(2023, 12, 1, 8, 0, 59)
     .lenText(u"operator")
     .i16(1)
     .lenText(u"Heat").lenText(u"H42")
     .u32(4).f32(200.0f).f32(10.0f).f32(200.5f).f32(12.0f);

    ParsedDocument doc = decoder.decode(pdz25File({{1004, s}}).data());
    const DecodedFields& r = doc.fields("Libs Alloy Sample");
    CHECK(r.get<uint64_t>("scan_index") == 77,                    "scan_index = 77");
    CHECK(r.get<std::string>("scan_id") == "BC-001",              "scan_id = BC-001");
    CHECK(r.get<Timestamp>("created").text == "2023-12-01 08:00:59", "created timestamp");
    CHECK(r.get<std::string>("field_value") == "H42",             "field_value = H42");
    const auto& xy = r.get<std::vector<float>>("spectrum_data");
    CHECK(xy.size() == 4, "4 floats, flat");
    CHECK(xy.size() == 4 && xy[2] == 200.5f, "spectrum_data[2] = 200.5");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 10: hard failures
// ─────────────────────────────────────────────────────────────────────────────
static void testHardFailures(const Decoder& decoder) {
    std::cout << "\n=== Test: Hard failures ===\n";

    bool threw = false;
    try {
        PdzBuilder v24;
        v24.u16(24).u32(0);
        (void)decoder.decode(v24.data());
    } catch (const DialectError&) {
        threw = true;
    }
    CHECK(threw, "version 24 -> DialectError");

    threw = false;
    try {
        (void)decoder.decode({});
    } catch (const DialectError&) {
        threw = true;
    }
    CHECK(threw, "empty buffer -> DialectError");

    threw = false;
    try {
        (void)decoder.decodeFile("/nonexistent/sample.pdz");
    } catch (const FileReadError&) {
        threw = true;
    }
    CHECK(threw, "missing file -> FileReadError");

    Decoder bare;
    CHECK(!bare.hasDialect(Dialect::PDZ25), "empty decoder has no dialects");
    threw = false;
    try {
        (void)bare.decode(pdz25File({}).data());
    } catch (const std::out_of_range&) {
        threw = true;
    }
    CHECK(threw, "decode without a registered schema -> std::out_of_range");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 11: decodeFile and custom schema registration
// ─────────────────────────────────────────────────────────────────────────────
static void testFileAndOverride() {
    std::cout << "\n=== Test: decodeFile and schema override ===\n";

    PdzBuilder trace;
    trace.lenText(u"boot ok");
    PdzBuilder file = pdz25File({{900, trace}});

    const fs::path path = fs::temp_directory_path() / "pdzreader_test_trace.pdz";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(file.data().data()),
                  static_cast<std::streamsize>(file.size()));
    }

    Decoder decoder = Decoder::withBuiltinSchemas();
    ParsedDocument doc = decoder.decodeFile(path);
    CHECK(doc.fields("Trace Log").get<std::string>("log") == "boot ok", "Trace Log read from disk");

    // Replace pdz25 with a schema that knows only the header, as a u16 pair
    decoder.registerDialect(loadSchemaFromString(
        "<Schema dialect=\"pdz25\" version=\"25\" name=\"Override\">"
        "  <Record type=\"25\" name=\"Header\">"
        "    <Field name=\"first\" type=\"u16\"/>"
        "  </Record>"
        "</Schema>"));
    CHECK(decoder.dialect(Dialect::PDZ25).name == "Override", "pdz25 schema replaced");

    doc = decoder.decodeFile(path);
    CHECK(doc.contains("Header"),                   "header renamed by the override");
    CHECK(doc.fields("Header").get<uint64_t>("first") == u'P', "first code unit of PDZ25");
    CHECK(doc.contains("Unknown Record Type 900"),  "900 no longer in the schema");

    fs::remove(path);
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    pdz::log::setLevel(pdz::log::Level::Info);

    try {
        const Decoder decoder = Decoder::withBuiltinSchemas();

        testSingleSpectrum(decoder);
        testMultiPhase(decoder);
        testTruncatedFile(decoder);
        testUnknownRecord(decoder);
        testPartialRecord(decoder);
        testGradeResults(decoder);
        testImages(decoder);
        testQuirks(decoder);
        testLibsSample(decoder);
        testHardFailures(decoder);
        testFileAndOverride();
    } catch (const std::exception& e) {
        std::cerr << "FAIL unexpected exception: " << e.what() << '\n';
        ++failures;
    }

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
