/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Base64.hpp"

#include <cctype>
#include <climits>

#include <openssl/evp.h>

std::optional<std::string> HBase64::Decode(std::string_view Encoded)
{
	std::string Compact{};
	Compact.reserve(Encoded.size());
	for (char C : Encoded)
	{
		if (!std::isspace(static_cast<unsigned char>(C)))
		{
			Compact.push_back(C);
		}
	}

	if (Compact.empty())
	{
		return std::string{};
	}

	if (Compact.size() % 4 != 0 || Compact.size() > static_cast<std::size_t>(INT_MAX))
	{
		return std::nullopt;
	}

	std::size_t Padding = 0;
	if (Compact.back() == '=')
	{
		++Padding;
		if (Compact[Compact.size() - 2] == '=')
		{
			++Padding;
		}
	}

	// '=' is only allowed as trailing padding
	if (Compact.find('=') < Compact.size() - Padding)
	{
		return std::nullopt;
	}

	std::string Decoded(Compact.size() / 4 * 3, '\0');
	int const   Length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(Decoded.data()),
		  reinterpret_cast<unsigned char const*>(Compact.data()), static_cast<int>(Compact.size()));
	if (Length < 0)
	{
		return std::nullopt;
	}

	// EVP_DecodeBlock decodes padding as zero bytes
	Decoded.resize(static_cast<std::size_t>(Length) - Padding);
	return Decoded;
}
