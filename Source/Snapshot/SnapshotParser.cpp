/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SnapshotParser.hpp"

#include <utility>
#include <spdlog/fmt/fmt.h>

namespace
{
	enum ELineKind
	{
		LK_Blank,
		LK_Comment,
		LK_Content
	};

	constexpr char kCommentMarker = '*';
	constexpr char kHeaderMarker = '#';
	constexpr char kDelimiter = ',';
	constexpr char kQuote = '"';
	constexpr char kLineBreak = '\n';
} // namespace

std::string_view HSnapshotParser::Trim(std::string_view Str)
{
	constexpr std::string_view Whitespace = " \t\r\n\v\f";
	auto const                 Begin = Str.find_first_not_of(Whitespace);
	if (Begin == std::string_view::npos)
	{
		return {};
	}
	auto const End = Str.find_last_not_of(Whitespace);
	return Str.substr(Begin, End - Begin + 1);
}

bool HSnapshotParser::SplitRecords(std::string_view Text, std::vector<HSnapshotRow>& OutRecords)
{
	OutRecords.clear();

	HSnapshotRow Record{};
	std::string  Cell{};
	bool         bInQuotes = false;
	bool         bCellStart = true;
	bool         bRecordStarted = false;

	for (size_t i = 0; i < Text.size(); ++i)
	{
		char const C = Text[i];

		if (bInQuotes)
		{
			if (C != kQuote)
			{
				// line breaks included
				Cell.push_back(C);
			}
			else if (i + 1 < Text.size() && Text[i + 1] == kQuote)
			{
				// escaped quote
				Cell.push_back(kQuote);
				++i;
			}
			else
			{
				bInQuotes = false;
			}
			continue;
		}

		if (C == kLineBreak)
		{
			if (bRecordStarted)
			{
				Record.emplace_back(std::move(Cell));
				OutRecords.emplace_back(std::move(Record));
			}
			Record.clear();
			Cell.clear();
			bCellStart = true;
			bRecordStarted = false;
			continue;
		}

		bRecordStarted = true;

		if (C == kDelimiter)
		{
			Record.emplace_back(std::move(Cell));
			Cell.clear();
			bCellStart = true;
			continue;
		}

		if (C == kQuote && bCellStart)
		{
			bInQuotes = true;
			bCellStart = false;
			continue;
		}

		// text after a closing quote or a stray quote inside an unquoted cell is kept as is
		Cell.push_back(C);
		bCellStart = false;
	}

	if (bInQuotes)
	{
		return false;
	}

	if (bRecordStarted)
	{
		Record.emplace_back(std::move(Cell));
		OutRecords.emplace_back(std::move(Record));
	}
	return true;
}

std::optional<HSnapshot> HSnapshotParser::Parse(std::string_view Text, HError& OutError)
{
	OutError = {};

	std::vector<std::string_view> Lines{};
	std::vector<ELineKind>        Kinds{};

	size_t Pos = 0;
	while (Pos <= Text.size())
	{
		auto End = Text.find('\n', Pos);
		if (End == std::string_view::npos)
		{
			End = Text.size();
		}
		auto const Line = Trim(Text.substr(Pos, End - Pos));
		Lines.push_back(Line);
		if (Line.empty())
		{
			Kinds.push_back(LK_Blank);
		}
		else if (Line.front() == kCommentMarker)
		{
			Kinds.push_back(LK_Comment);
		}
		else
		{
			Kinds.push_back(LK_Content);
		}
		Pos = End + 1;
	}

	std::optional<size_t> First{};
	size_t                Last = 0;
	for (size_t i = 0; i < Kinds.size(); ++i)
	{
		if (Kinds[i] != LK_Content)
		{
			continue;
		}
		if (!First)
		{
			First = i;
		}
		Last = i;
	}

	if (!First)
	{
		OutError = HError(EHarvestError::Format, "no data");
		return std::nullopt;
	}

	for (size_t i = *First; i <= Last; ++i)
	{
		if (Kinds[i] == LK_Comment)
		{
			OutError = HError(EHarvestError::Format, fmt::format("comment in the middle (line {})", i + 1));
			return std::nullopt;
		}
		if (i != *First && Kinds[i] == LK_Content && Lines[i].front() == kHeaderMarker)
		{
			OutError = HError(EHarvestError::Format, fmt::format("unexpected header on line {}", i + 1));
			return std::nullopt;
		}
	}

	if (Lines[*First].front() != kHeaderMarker)
	{
		OutError = HError(EHarvestError::Format, fmt::format("line {} is not a header", *First + 1));
		return std::nullopt;
	}

	HSnapshot                 Snapshot{};
	std::vector<HSnapshotRow> HeaderRecords{};
	if (!SplitRecords(Lines[*First].substr(1), HeaderRecords))
	{
		OutError = HError(EHarvestError::Format, "unterminated quote in header");
		return std::nullopt;
	}
	if (!HeaderRecords.empty())
	{
		Snapshot.Header = std::move(HeaderRecords.front());
	}

	// quoted cells may continue on the next line, so the rows are split as one block
	std::string Data{};
	for (size_t i = *First + 1; i <= Last; ++i)
	{
		Data.append(Lines[i]);
		Data.push_back(kLineBreak);
	}

	if (!SplitRecords(Data, Snapshot.Rows))
	{
		OutError = HError(
			EHarvestError::Format, fmt::format("unterminated quote on row {}", Snapshot.Rows.size() + 1));
		return std::nullopt;
	}

	size_t const NumColumns = Snapshot.Header.size();
	for (size_t RowIndex = 0; RowIndex < Snapshot.Rows.size(); ++RowIndex)
	{
		auto& Row = Snapshot.Rows[RowIndex];
		if (Row.size() > NumColumns)
		{
			OutError = HError(EHarvestError::Format,
				fmt::format("too many columns on row {}: found {}, header has {}", RowIndex + 1, Row.size(), NumColumns));
			return std::nullopt;
		}

		// the feed is known to emit ragged rows
		Row.resize(NumColumns);
	}

	return Snapshot;
}
