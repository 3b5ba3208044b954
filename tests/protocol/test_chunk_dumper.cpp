#define BOOST_TEST_MODULE ChunkDumperTest
#include <boost/property_tree/ptree.hpp>
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <string>

#include "chunkwire/protocol/chunk_dumper.hpp"
#include "chunkwire/protocol/message_ids.hpp"

using namespace chunkwire::protocol;

namespace {

std::string render(const ChunkDumper& dumper, const Bytes& stream) {
    std::ostringstream out;
    dumper.dump(stream, out);
    return out.str();
}

Bytes concat(Bytes first, const Bytes& second) {
    first.insert(first.end(), second.begin(), second.end());
    return first;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(ChunkDumperTests)

BOOST_AUTO_TEST_CASE(TestNestedDelayRequest) {
    ChunkDumper dumper;
    Bytes stream = make_chunk(ids::kRequestDelay, Mapping{{ids::kInterval, 5}});

    BOOST_CHECK_EQUAL(render(dumper, stream),
                      "DLAY [9] (request_delay)\n"
                      "  NTVL [1] (interval) \"5\"\n");
}

BOOST_AUTO_TEST_CASE(TestComputeReplyWithoutNames) {
    DumpConfig config;
    config.show_names = false;
    ChunkDumper dumper(config);

    Bytes stream = make_chunk(
        ids::kReplyAnswer,
        Mapping{{ids::kStatus, 1}, {ids::kValue, "3"}});

    BOOST_CHECK_EQUAL(render(dumper, stream),
                      "ANSR [18]\n"
                      "  STS  [1] \"1\"\n"
                      "  VALU [1] \"3\"\n");
}

BOOST_AUTO_TEST_CASE(TestNotNestedUnlessConfigured) {
    DumpConfig config;
    config.nested_tags.clear();
    ChunkDumper dumper(config);

    Bytes stream = make_chunk(ids::kRequestDelay, Mapping{{ids::kInterval, 5}});
    const std::string output = render(dumper, stream);
    BOOST_CHECK(output.rfind("DLAY [9] (request_delay) ", 0) == 0);
    BOOST_CHECK(output.find("\n  ") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestMaxDepth) {
    DumpConfig config;
    config.nested_tags = {"WRAP"};
    config.max_depth = 1;
    config.show_names = false;
    ChunkDumper dumper(config);

    Bytes inner = make_chunk(Tag("WRAP"), make_chunk(Tag("LEAF"), "x"));
    Bytes outer = make_chunk(Tag("WRAP"), inner);

    const std::string output = render(dumper, outer);
    BOOST_CHECK_EQUAL(output,
                      "WRAP [17]\n"
                      "  WRAP [9] 4c 45 41 46 01 00 00 00 78\n");
}

BOOST_AUTO_TEST_CASE(TestBinaryPayloadAsHex) {
    ChunkDumper dumper;
    Bytes stream = make_chunk(Tag("BLOB"), Bytes{0x00, 0xab, 0x7f});
    BOOST_CHECK_EQUAL(render(dumper, stream), "BLOB [3] 00 ab 7f\n");
}

BOOST_AUTO_TEST_CASE(TestPayloadPreviewTruncated) {
    DumpConfig config;
    config.max_payload_preview = 4;
    ChunkDumper dumper(config);

    Bytes stream = make_chunk(ids::kRequestEcho, "hello world");
    BOOST_CHECK_EQUAL(render(dumper, stream), "ECHO [11] (echo) \"hell\"...\n");

    config.max_payload_preview = 0;
    ChunkDumper unlimited(config);
    BOOST_CHECK_EQUAL(render(unlimited, stream),
                      "ECHO [11] (echo) \"hello world\"\n");
}

BOOST_AUTO_TEST_CASE(TestQuotesAreEscaped) {
    ChunkDumper dumper;
    Bytes stream = make_chunk(Tag("TEXT"), "say \"hi\"");
    BOOST_CHECK_EQUAL(render(dumper, stream), "TEXT [8] \"say \\\"hi\\\"\"\n");
}

BOOST_AUTO_TEST_CASE(TestTrailingBytesReported) {
    ChunkDumper dumper;
    Bytes stream =
        concat(make_chunk(ids::kRequestShutdown, ""), Bytes{'N', 'O', 'O'});

    std::ostringstream out;
    BOOST_CHECK_EQUAL(dumper.dump(stream, out), 1u);
    BOOST_CHECK_EQUAL(out.str(),
                      "SHUT [0] (request_shutdown) \"\"\n"
                      "<3 trailing bytes>\n");
}

BOOST_AUTO_TEST_CASE(TestNestedPayloadWithGarbage) {
    DumpConfig config;
    config.show_names = false;
    ChunkDumper dumper(config);

    Bytes stream = make_chunk(ids::kRequestCompute, "xyz");
    BOOST_CHECK_EQUAL(render(dumper, stream),
                      "CMPU [3]\n"
                      "  <3 trailing bytes>\n");
}

BOOST_AUTO_TEST_CASE(TestFormatTag) {
    BOOST_CHECK_EQUAL(ChunkDumper::format_tag(Tag("STS ")), "STS ");
    BOOST_CHECK_EQUAL(ChunkDumper::format_tag(Tag(std::string("A\0\x01\\", 4))),
                      "A\\x00\\x01\\x5c");
}

BOOST_AUTO_TEST_CASE(TestDumpConfigFromPtree) {
    boost::property_tree::ptree pt;
    pt.put("nested_tags", "DLAY,WRAP");
    pt.put("max_depth", 2);
    pt.put("max_payload_preview", 16);
    pt.put("show_names", false);

    DumpConfig config;
    config.from_ptree(pt);
    BOOST_CHECK_NO_THROW(config.validate());
    BOOST_REQUIRE_EQUAL(config.nested_tags.size(), 2u);
    BOOST_CHECK_EQUAL(config.nested_tags[1], "WRAP");
    BOOST_CHECK_EQUAL(config.max_depth, 2);
    BOOST_CHECK_EQUAL(config.max_payload_preview, 16u);
    BOOST_CHECK(!config.show_names);
    BOOST_CHECK(config.nested_tag_values()[0] == ids::kRequestDelay);
}

BOOST_AUTO_TEST_CASE(TestDumpConfigValidation) {
    DumpConfig config;
    config.nested_tags = {"BAD"};
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
    BOOST_CHECK_THROW(ChunkDumper{config}, InvalidTag);

    DumpConfig negative;
    negative.max_depth = -1;
    BOOST_CHECK_THROW(negative.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
