/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace EIPFamily
{
	enum Type : uint8_t
	{
		Unknown = 0,
		IPv4 = 4,
		IPv6 = 6
	};
} // namespace EIPFamily

struct HIPAddress
{
	// IPv4: first 4 bytes used; IPv6: all 16 bytes used.
	std::array<uint8_t, 16> Bytes{};
	EIPFamily::Type         Family{};

	[[nodiscard]] std::string ToString() const
	{
		if (Family == EIPFamily::IPv4)
		{
			in_addr Addr4{};
			Addr4.s_addr = htonl((Bytes[0] << 24) | (Bytes[1] << 16) | (Bytes[2] << 8) | Bytes[3]);
			char        Buffer[INET_ADDRSTRLEN];
			char const* Result = inet_ntop(AF_INET, &Addr4, Buffer, INET_ADDRSTRLEN);
			if (Result)
			{
				return { Buffer };
			}
			return {};
		}

		if (Family == EIPFamily::IPv6)
		{
			in6_addr Addr6{};
			for (unsigned long i = 0; i < 16; ++i)
			{
				Addr6.s6_addr[i] = Bytes[i];
			}
			char        Buffer[INET6_ADDRSTRLEN];
			char const* Result = inet_ntop(AF_INET6, &Addr6, Buffer, INET6_ADDRSTRLEN);
			if (Result)
			{
				return { Buffer };
			}
		}
		return {};
	}

	// Accepts dotted IPv4 and any textual IPv6 form, everything else is rejected
	static std::optional<HIPAddress> FromString(std::string const& Str)
	{
		HIPAddress Result{};

		in_addr Addr4{};
		if (inet_pton(AF_INET, Str.c_str(), &Addr4) == 1)
		{
			uint32_t const HostOrder = ntohl(Addr4.s_addr);
			Result.Bytes[0] = static_cast<uint8_t>((HostOrder >> 24) & 0xFF);
			Result.Bytes[1] = static_cast<uint8_t>((HostOrder >> 16) & 0xFF);
			Result.Bytes[2] = static_cast<uint8_t>((HostOrder >> 8) & 0xFF);
			Result.Bytes[3] = static_cast<uint8_t>(HostOrder & 0xFF);
			Result.Family = EIPFamily::IPv4;
			return Result;
		}

		in6_addr Addr6{};
		if (inet_pton(AF_INET6, Str.c_str(), &Addr6) == 1)
		{
			for (unsigned long i = 0; i < 16; ++i)
			{
				Result.Bytes[i] = Addr6.s6_addr[i];
			}
			Result.Family = EIPFamily::IPv6;
			return Result;
		}

		return std::nullopt;
	}

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Bytes, Family);
	}
};

inline bool operator==(HIPAddress const& Lhs, HIPAddress const& Rhs)
{
	return Lhs.Bytes == Rhs.Bytes && Lhs.Family == Rhs.Family;
}

inline bool operator!=(HIPAddress const& Lhs, HIPAddress const& Rhs)
{
	return !(Lhs == Rhs);
}
