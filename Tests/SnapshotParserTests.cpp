/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Snapshot/SnapshotParser.hpp"

TEST(SnapshotParser, ParsesHeaderBetweenComments)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("*comment\n#Name,Score\nfoo,10\n", Error);

	ASSERT_TRUE(Snapshot.has_value()) << Error.ToString();
	EXPECT_TRUE(Error.IsOk());
	EXPECT_EQ(Snapshot->Header, (HSnapshotRow{ "Name", "Score" }));
	ASSERT_EQ(Snapshot->Rows.size(), 1u);
	EXPECT_EQ(Snapshot->Rows[0], (HSnapshotRow{ "foo", "10" }));
}

TEST(SnapshotParser, AcceptsTrailingComments)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("*vpn_servers\n#A,B\n1,2\n3,4\n*\n", Error);

	ASSERT_TRUE(Snapshot.has_value()) << Error.ToString();
	EXPECT_EQ(Snapshot->Rows.size(), 2u);
	EXPECT_EQ(Snapshot->Rows[1], (HSnapshotRow{ "3", "4" }));
}

TEST(SnapshotParser, HandlesCarriageReturnsAndBlankLines)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("\r\n#A,B\r\n1,2\r\n\r\n3,4\r\n", Error);

	ASSERT_TRUE(Snapshot.has_value()) << Error.ToString();
	EXPECT_EQ(Snapshot->Header, (HSnapshotRow{ "A", "B" }));
	ASSERT_EQ(Snapshot->Rows.size(), 2u);
	EXPECT_EQ(Snapshot->Rows[0], (HSnapshotRow{ "1", "2" }));
	EXPECT_EQ(Snapshot->Rows[1], (HSnapshotRow{ "3", "4" }));
}

TEST(SnapshotParser, PadsShortRows)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("#A,B,C\nx\n", Error);

	ASSERT_TRUE(Snapshot.has_value()) << Error.ToString();
	ASSERT_EQ(Snapshot->Rows.size(), 1u);
	EXPECT_EQ(Snapshot->Rows[0], (HSnapshotRow{ "x", "", "" }));
}

TEST(SnapshotParser, RejectsTooManyColumns)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("#A,B\n1,2,3\n", Error);

	EXPECT_FALSE(Snapshot.has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
	EXPECT_EQ(Error.Message, "too many columns on row 1: found 3, header has 2");
}

TEST(SnapshotParser, RejectsCommentOnlyInput)
{
	HError Error{};
	EXPECT_FALSE(HSnapshotParser::Parse("*a\n*b\n", Error).has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
	EXPECT_EQ(Error.Message, "no data");
}

TEST(SnapshotParser, RejectsEmptyInput)
{
	HError Error{};
	EXPECT_FALSE(HSnapshotParser::Parse("", Error).has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
}

TEST(SnapshotParser, HeaderOnlyHasNoRows)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("*x\n#A,B\n*y\n", Error);

	ASSERT_TRUE(Snapshot.has_value()) << Error.ToString();
	EXPECT_EQ(Snapshot->Header, (HSnapshotRow{ "A", "B" }));
	EXPECT_TRUE(Snapshot->Rows.empty());
}

TEST(SnapshotParser, RejectsCommentInTheMiddle)
{
	HError Error{};
	EXPECT_FALSE(HSnapshotParser::Parse("#A,B\n1,2\n*oops\n3,4\n", Error).has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
	EXPECT_EQ(Error.Message, "comment in the middle (line 3)");
}

TEST(SnapshotParser, RejectsMissingHeaderMarker)
{
	HError Error{};
	EXPECT_FALSE(HSnapshotParser::Parse("*c\nA,B\n1,2\n", Error).has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
	EXPECT_EQ(Error.Message, "line 2 is not a header");
}

TEST(SnapshotParser, RejectsSecondHeader)
{
	HError Error{};
	EXPECT_FALSE(HSnapshotParser::Parse("#A,B\n1,2\n#A,B\n", Error).has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
	EXPECT_EQ(Error.Message, "unexpected header on line 3");
}

TEST(SnapshotParser, KeepsQuotedDelimiters)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("#Name,Message\nfoo,\"hello, \"\"world\"\"\"\n", Error);

	ASSERT_TRUE(Snapshot.has_value()) << Error.ToString();
	ASSERT_EQ(Snapshot->Rows.size(), 1u);
	EXPECT_EQ(Snapshot->Rows[0], (HSnapshotRow{ "foo", "hello, \"world\"" }));
}

TEST(SnapshotParser, RejectsUnterminatedQuote)
{
	HError Error{};
	EXPECT_FALSE(HSnapshotParser::Parse("#A,B\n1,\"2\n", Error).has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
}

TEST(SnapshotParser, QuotedCellMaySpanLines)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("#HostName,Message,Score\nfoo,\"line one\nline two\",5\nbar,,6", Error);

	ASSERT_TRUE(Snapshot.has_value()) << Error.ToString();
	ASSERT_EQ(Snapshot->Rows.size(), 2u);
	EXPECT_EQ(Snapshot->Rows[0], (HSnapshotRow{ "foo", "line one\nline two", "5" }));
	EXPECT_EQ(Snapshot->Rows[1], (HSnapshotRow{ "bar", "", "6" }));
}

TEST(SnapshotParser, RowNumbersCountRecordsNotLines)
{
	HError Error{};
	auto   Snapshot = HSnapshotParser::Parse("#A,B\n1,\"x\ny\"\n2,3,4\n", Error);

	EXPECT_FALSE(Snapshot.has_value());
	EXPECT_EQ(Error.Message, "too many columns on row 2: found 3, header has 2");
}

TEST(SnapshotParser, QuoteOpenAtEndIsFormatError)
{
	HError Error{};
	EXPECT_FALSE(HSnapshotParser::Parse("#A,B\n1,2\n3,\"open\nstill open\n", Error).has_value());
	EXPECT_EQ(Error.Code, EHarvestError::Format);
	EXPECT_EQ(Error.Message, "unterminated quote on row 2");
}

TEST(SnapshotParser, SplitRecordsKeepsEmptyCells)
{
	std::vector<HSnapshotRow> Records{};
	ASSERT_TRUE(HSnapshotParser::SplitRecords(",a,,\n\nb", Records));
	ASSERT_EQ(Records.size(), 2u);
	EXPECT_EQ(Records[0], (HSnapshotRow{ "", "a", "", "" }));
	EXPECT_EQ(Records[1], (HSnapshotRow{ "b" }));
}
