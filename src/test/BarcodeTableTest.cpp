#include <gtest/gtest.h>

#include "BarcodeTable.hpp"
#include "TestHelper.hpp"

TEST(Well, from_code)
{
    Well well = Well::from_code("2C07");
    EXPECT_EQ(well.plate, 2);
    EXPECT_EQ(well.row, 'C');
    EXPECT_EQ(well.column, 7);
    EXPECT_EQ(well.row_index(), 2);
    EXPECT_EQ(well.code(), "2C07");
    EXPECT_EQ(Well::from_code("1H12").code(), "1H12");
}

TEST(Well, invalid_codes)
{
    EXPECT_THROW(Well::from_code(""), FatalInputError);
    EXPECT_THROW(Well::from_code("1A1"), FatalInputError);
    EXPECT_THROW(Well::from_code("1A001"), FatalInputError);
    EXPECT_THROW(Well::from_code("0A01"), FatalInputError);
    EXPECT_THROW(Well::from_code("1I01"), FatalInputError);
    EXPECT_THROW(Well::from_code("1a01"), FatalInputError);
    EXPECT_THROW(Well::from_code("1A00"), FatalInputError);
    EXPECT_THROW(Well::from_code("1A13"), FatalInputError);
}

TEST(Well, ordering)
{
    EXPECT_LT(Well::from_code("1A12"), Well::from_code("1B01"));
    EXPECT_LT(Well::from_code("1H12"), Well::from_code("2A01"));
    EXPECT_LT(Well::from_code("1A02"), Well::from_code("1A10"));
    EXPECT_EQ(Well::from_code("1A01"), Well::from_code("1A01"));
}

TEST(BarcodeTable, load_keeps_descriptor_order)
{
    BarcodeTable table = BarcodeTable::load(test_data("cells.json"));
    ASSERT_EQ(table.size(), 4u);
    EXPECT_EQ(table.well_at(0).code(), "1A01");
    EXPECT_EQ(table.well_at(1).code(), "1A02");
    EXPECT_EQ(table.well_at(2).code(), "1B01");
    EXPECT_EQ(table.well_at(3).code(), "2A01");

    ASSERT_EQ(table.pairs_at(0).size(), 2u);
    EXPECT_EQ(table.pairs_at(0).at(1), BarcodePair("F1", "R2"));
    EXPECT_EQ(table.get_plates(), std::vector<int>({1, 2}));
    EXPECT_TRUE(table.overlapping_pairs().empty());
}

TEST(BarcodeTable, find_well)
{
    BarcodeTable table = BarcodeTable::load(test_data("cells.json"));
    ASSERT_TRUE(table.find_well(BarcodePair("F1", "R2")).has_value());
    EXPECT_EQ(table.find_well(BarcodePair("F1", "R2")).value(), 0u);
    EXPECT_EQ(table.find_well(BarcodePair("F4", "R4")).value(), 3u);
    //pairs are ordered, the swapped pair is unknown
    EXPECT_FALSE(table.find_well(BarcodePair("R1", "F1")).has_value());
    EXPECT_FALSE(table.find_well(BarcodePair("F2", "R2")).has_value());

    EXPECT_TRUE(table.accepts(1, BarcodePair("F2", "R1")));
    EXPECT_FALSE(table.accepts(1, BarcodePair("F1", "R1")));
    EXPECT_EQ(table.index_of(Well::from_code("1B01")).value(), 2u);
    EXPECT_FALSE(table.index_of(Well::from_code("3A01")).has_value());
}

TEST(BarcodeTable, overlapping_pairs_go_to_first_well)
{
    BarcodeTable table = BarcodeTable::load(test_data("overlapping.json"));
    ASSERT_EQ(table.overlapping_pairs().size(), 1u);
    const BarcodeOverlap& overlap = table.overlapping_pairs().front();
    EXPECT_EQ(overlap.pair, BarcodePair("F1", "R1"));
    EXPECT_EQ(overlap.assignedWell.code(), "1A01");
    EXPECT_EQ(overlap.shadowedWell.code(), "1A02");

    EXPECT_EQ(table.find_well(BarcodePair("F1", "R1")).value(), 0u);
    EXPECT_EQ(table.find_well(BarcodePair("F2", "R2")).value(), 1u);
}

TEST(BarcodeTable, malformed_descriptors)
{
    EXPECT_THROW(BarcodeTable::load(test_data("does_not_exist.json")), FatalInputError);
    EXPECT_THROW(BarcodeTable::load(test_data("malformed.json")), FatalInputError);
    EXPECT_THROW(BarcodeTable::load(test_data("duplicate_wells.json")), FatalInputError);
    EXPECT_THROW(BarcodeTable::load(test_data("bad_well.json")), FatalInputError);
    EXPECT_THROW(BarcodeTable::load(test_data("bad_pair.json")), FatalInputError);
}

TEST(BarcodeTable, descriptor_without_wells)
{
    TmpDir dir("barcodes");
    write_text(dir.file("empty.json"), "{}");
    EXPECT_THROW(BarcodeTable::load(dir.file("empty.json")), FatalInputError);

    write_text(dir.file("scalar.json"), "{\"1A01\": \"F1\"}");
    EXPECT_THROW(BarcodeTable::load(dir.file("scalar.json")), FatalInputError);
}

TEST(BarcodeTable, add_well_rejects_duplicates)
{
    BarcodeTable table;
    table.add_well(Well::from_code("1A01"), {BarcodePair("F1", "R1")});
    EXPECT_THROW(table.add_well(Well::from_code("1A01"), {BarcodePair("F2", "R2")}), FatalInputError);
    EXPECT_EQ(table.size(), 1u);
}

TEST(DemultiplexedLine, barcode_suffix)
{
    EXPECT_EQ(barcode_suffix("r1 1:N:0:1 F1"), "F1");
    EXPECT_EQ(barcode_suffix("r1 1:N:0:1\tBC_12  "), "BC_12");
    EXPECT_EQ(barcode_suffix("F3"), "F3");
    EXPECT_EQ(barcode_suffix(""), "");
}
