#include <gtest/gtest.h>

#include <sstream>

#include "CallReport.hpp"
#include "TestHelper.hpp"

namespace
{

CallReportRow row(int plate, const std::string& well, const std::string& candidate, double evalue, double pident)
{
    CallReportRow r;
    r.plate = plate;
    r.well = well;
    r.candidate = candidate;
    r.evalue = evalue;
    r.percentIdentity = pident;
    r.length = 400;
    r.bitscore = 700;
    r.rawCount = 120;
    r.queryCount = 3;
    return r;
}

ConsensusCall two_candidate_call()
{
    HomologyHit top;
    top.subjectAccession = "KX1";
    top.percentIdentity = 99.5;
    top.length = 420;
    top.evalue = 1e-150;
    top.bitscore = 760;
    HomologyHit other = top;
    other.subjectAccession = "KX2";

    ConsensusCall call;
    call.hits = {top, other};
    call.queryFile = "rep1_contigs.fasta:rep2_contigs.fasta";
    call.queryName = "k141_1";
    call.querySeq = "ACGT";
    call.fromIntersection = true;
    return call;
}

}

TEST(CallReport, make_report_row)
{
    CallReportRow r = make_report_row(Well::from_code("2B07"), two_candidate_call(), 55, 4);
    EXPECT_EQ(r.plate, 2);
    EXPECT_EQ(r.well, "B07");
    EXPECT_EQ(r.candidate, "KX1");
    EXPECT_EQ(r.length, 420u);
    EXPECT_EQ(r.rawCount, 55u);
    EXPECT_EQ(r.queryCount, 4u);
    EXPECT_TRUE(r.fromIntersection);
    EXPECT_EQ(r.otherCandidates, std::vector<std::string>({"KX2"}));
}

TEST(CallReport, rows_sorted_by_plate_and_well)
{
    CallReport report;
    report.add_row(row(2, "A01", "c", 1e-10, 99));
    report.add_row(row(1, "B01", "b", 1e-10, 99));
    report.add_row(row(1, "A12", "a", 1e-10, 99));
    report.add_call(Well::from_code("1A02"), std::nullopt, 10, 0);
    report.sort_rows();

    ASSERT_EQ(report.size(), 3u);
    EXPECT_EQ(report.get_rows().at(0).candidate, "a");
    EXPECT_EQ(report.get_rows().at(1).candidate, "b");
    EXPECT_EQ(report.get_rows().at(2).candidate, "c");
}

TEST(CallReport, csv_output)
{
    CallReport report;
    report.add_call(Well::from_code("1C03"), two_candidate_call(), 55, 4);
    CallReportRow quoted = row(1, "A01", "name, with comma", 1e-5, 90);
    report.add_row(quoted);

    std::ostringstream os;
    report.write(os);
    std::istringstream lines(os.str());
    std::string header, first, second;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);

    EXPECT_EQ(header, "plate,well,candidate,percent_identity,length,evalue,bitscore,query_seq,query_file,query_name,"
                      "from_intersection,raw_count,query_count,other_candidates");
    EXPECT_EQ(first.substr(0, 25), "1,A01,\"name, with comma\",");
    EXPECT_EQ(second, "1,C03,KX1,99.5,420,1e-150,760,ACGT,rep1_contigs.fasta:rep2_contigs.fasta,k141_1,true,55,4,KX2");
}

TEST(CallReport, csv_keeps_blast_digits)
{
    CallReport report;
    CallReportRow precise = row(1, "A01", "KX1", 3.45678912e-123, 99.123);
    precise.bitscore = 1234.56789;
    report.add_row(precise);

    std::ostringstream os;
    os << 1.0 / 3.0 << ';';
    report.write(os);
    EXPECT_NE(os.str().find(",400,3.45678912e-123,1234.56789,"), std::string::npos);
    EXPECT_NE(os.str().find("99.123,"), std::string::npos);

    //the precision of the stream is unchanged afterwards
    os << 1.0 / 3.0;
    EXPECT_EQ(os.str().substr(0, 9), "0.333333;");
    EXPECT_EQ(os.str().substr(os.str().size() - 8), "0.333333");
}

TEST(CallReport, write_file)
{
    TmpDir dir("report");
    CallReport report;
    report.write(dir.file("reports/empty_calls.csv"));
    EXPECT_EQ(read_text(dir.file("reports/empty_calls.csv")),
              "plate,well,candidate,percent_identity,length,evalue,bitscore,query_seq,query_file,query_name,"
              "from_intersection,raw_count,query_count,other_candidates\n");
}

TEST(ReportFilter, numeric_clauses)
{
    CallReport report;
    report.add_row(row(1, "A01", "good", 1e-60, 99.0));
    report.add_row(row(1, "A02", "weak_evalue", 1e-20, 99.0));
    report.add_row(row(1, "A03", "low_identity", 1e-60, 90.0));

    report.filter(parse_report_filter("evalue<=1e-50 && pident>=97"));
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report.get_rows().front().candidate, "good");
}

TEST(ReportFilter, text_and_boolean_clauses)
{
    CallReportRow r = row(2, "B03", "KX1", 1e-60, 99.0);
    r.fromIntersection = true;

    EXPECT_TRUE(parse_report_filter("well==B03")(r));
    EXPECT_TRUE(parse_report_filter("candidate != 'KX2'")(r));
    EXPECT_TRUE(parse_report_filter("candidate == \"KX1\" && plate == 2")(r));
    EXPECT_FALSE(parse_report_filter("well < B01")(r));
    EXPECT_TRUE(parse_report_filter("from_intersection == true")(r));
    EXPECT_FALSE(parse_report_filter("from_intersection==0")(r));
    EXPECT_TRUE(parse_report_filter("raw_count>100 && query_count<=3 && length==400 && bitscore>699.5")(r));
}

TEST(ReportFilter, empty_filter_accepts_everything)
{
    CallReportRow r = row(1, "A01", "KX1", 1.0, 10.0);
    EXPECT_TRUE(parse_report_filter("")(r));
    EXPECT_TRUE(parse_report_filter("   ")(r));
}

TEST(ReportFilter, invalid_expressions)
{
    EXPECT_THROW(parse_report_filter("evalue"), ConfigError);
    EXPECT_THROW(parse_report_filter("coverage>10"), ConfigError);
    EXPECT_THROW(parse_report_filter("evalue<=abc"), ConfigError);
    EXPECT_THROW(parse_report_filter("evalue<="), ConfigError);
    EXPECT_THROW(parse_report_filter("pident>=97 &&"), ConfigError);
    EXPECT_THROW(parse_report_filter("pident=97"), ConfigError);
    EXPECT_THROW(parse_report_filter("from_intersection==maybe"), ConfigError);
}
