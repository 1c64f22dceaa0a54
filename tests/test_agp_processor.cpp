#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "TestHelpers.hpp"
#include "core/AgpProcessor.hpp"
#include "utils/FastaReader.hpp"

using namespace AgpAssembler;
using AgpAssembler::Testing::InMemorySource;

class AgpProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        source.add("ctg1", "ACGTACGTAC");
        source.add("ctg2", "GGGAAA");
    }

    ProcessResult run(const std::string& agp_text, const BuilderOptions& options = {}) {
        std::istringstream in(agp_text);
        AgpProcessor processor(source, options);
        return processor.process(in, out);
    }

    InMemorySource source;
    std::ostringstream out;
};

TEST_F(AgpProcessorTest, ConvertsFileWithHeaderComments) {
    ProcessResult r = run(
        "##agp-version\t2.1\n"
        "# ORGANISM: test\n"
        "scaf1\t1\t10\t1\tW\tctg1\t1\t10\t+\n"
        "scaf1\t11\t60\t2\tN\t50\tcontig\tno\tna\n"
        "scaf2\t1\t6\t1\tW\tctg2\t1\t6\t-\n");
    ASSERT_TRUE(r.success) << r.error->message();
    EXPECT_EQ(out.str(), ">scaf1\nACGTACGTAC" + std::string(50, 'N') + "\n\n>scaf2\nTTTCCC\n");
    EXPECT_EQ(r.lines_read, 5u);
    EXPECT_EQ(r.comment_lines, 2u);
    EXPECT_EQ(r.summary.num_objects, 2);
    EXPECT_EQ(r.summary.sequence_bases, 16);
    EXPECT_EQ(r.summary.gap_bases, 50);
}

TEST_F(AgpProcessorTest, LastLineWithoutNewline) {
    ProcessResult r = run("scaf1\t1\t10\t1\tW\tctg1\t1\t10\t+");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(out.str(), ">scaf1\nACGTACGTAC\n");
}

TEST_F(AgpProcessorTest, StopsAtFirstError) {
    ProcessResult r = run(
        "scaf1\t1\t10\t1\tW\tctg1\t1\t10\t+\n"
        "# misplaced\n"
        "scaf1\t11\t16\t2\tW\tctg2\t1\t6\t+\n");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::STRUCTURAL);
    EXPECT_EQ(r.error->line_number, 2u);
    EXPECT_EQ(r.lines_read, 2u);
    EXPECT_EQ(out.str(), ">scaf1\nACGTACGTAC");
}

TEST_F(AgpProcessorTest, InvalidLineWritesNothingForThatLine) {
    ProcessResult r = run(
        "scaf1\t1\t10\t1\tW\tctg1\t1\t10\t+\n"
        "scaf2\t1\t50\t1\tU\t100\tscaffold\tyes\tna\n");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::CONSISTENCY);
    EXPECT_EQ(r.error->line_number, 2u);
    EXPECT_EQ(out.str(), ">scaf1\nACGTACGTAC");
}

TEST_F(AgpProcessorTest, ZeroPartNumberIsOrderingError) {
    ProcessResult r = run(
        "scaf1\t1\t10\t1\tW\tctg1\t1\t10\t+\n"
        "scaf1\t11\t20\t0\tW\tctg1\t1\t10\t+\n");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
    EXPECT_EQ(r.error->line_number, 2u);
    EXPECT_EQ(out.str(), ">scaf1\nACGTACGTAC");
}

TEST_F(AgpProcessorTest, FinalCoverageReportedOnLastLine) {
    ProcessResult r = run(
        "scaf1\t1\t10\t1\tW\tctg1\t1\t10\t+\n"
        "scaf1\t21\t26\t2\tW\tctg2\t1\t6\t+\n");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::COVERAGE);
    EXPECT_EQ(r.error->line_number, 2u);
    // No trailing newline after a failed run
    EXPECT_EQ(out.str(), ">scaf1\nACGTACGTACGGGAAA");
}

TEST_F(AgpProcessorTest, MissingAgpFile) {
    AgpProcessor processor(source);
    ProcessResult r = processor.process_file("/nonexistent/scaffolds.agp", out);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::IO);
    EXPECT_TRUE(out.str().empty());
}

TEST(AgpProcessorFileTest, EndToEndWithIndexedFasta) {
    std::string fasta = Testing::write_temp_file("agpassembler_e2e.fa", ">ctg1\nACGTACGTAC\n>ctg2\nGGGAAA\n");
    std::remove((fasta + ".fai").c_str());
    std::string agp = Testing::write_temp_file("agpassembler_e2e.agp",
                                               "##agp-version\t2.1\n"
                                               "chr1\t1\t6\t1\tW\tctg2\t1\t6\t-\n"
                                               "chr1\t7\t106\t2\tU\t100\tscaffold\tyes\tmap;pcr\n"
                                               "chr1\t107\t116\t3\tW\tctg1\t1\t10\t+\n");

    std::ostringstream out;
    {
        FastaReader reader(fasta);
        AgpProcessor processor(reader);
        ProcessResult r = processor.process_file(agp, out);
        EXPECT_TRUE(r.success) << (r.error ? r.error->message() : "");
        EXPECT_EQ(r.summary.num_component_records, 2);
    }
    EXPECT_EQ(out.str(), ">chr1\nTTTCCC" + std::string(100, 'N') + "ACGTACGTAC\n");

    Testing::remove_temp_file(fasta);
    std::remove(agp.c_str());
}
