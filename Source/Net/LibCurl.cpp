//
// Created by usr on 14/01/2026.
//

#include "LibCurl.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <dlfcn.h>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace
{
	// Values from curl/curl.h, the header isn't needed at build time
	constexpr int kOptUrl = 10002;
	constexpr int kOptWriteFunction = 20011;
	constexpr int kOptWriteData = 10001;
	constexpr int kOptUserAgent = 10018;
	constexpr int kOptFollowLocation = 52;
	constexpr int kOptMaxRedirs = 68;
	constexpr int kOptTimeout = 13;        // seconds
	constexpr int kOptConnectTimeout = 78; // seconds
	constexpr int kOptAcceptEncoding = 10102;
	constexpr int kInfoResponseCode = 0x200000 + 2;
	constexpr int kInfoContentType = 0x100000 + 18;
	constexpr int kCurlOk = 0;

	constexpr std::array kSonames = { "libcurl.so.4", "libcurl.so", "libcurl-gnutls.so.4" };

	size_t AppendToString(char* Data, size_t Size, size_t Count, void* UserData)
	{
		static_cast<std::string*>(UserData)->append(Data, Size * Count);
		return Size * Count;
	}
} // namespace

void HLibCurl::Load()
{
	for (auto const* Soname : kSonames)
	{
		Handle = dlopen(Soname, RTLD_LAZY | RTLD_LOCAL);
		if (Handle)
		{
			spdlog::debug("LibCurl: using {}", Soname);
			break;
		}
	}

	if (!Handle)
	{
		spdlog::warn("LibCurl: failed to load libcurl: {}. Snapshots can only be read from files.", dlerror());
		return;
	}

	Resolve();
	if (!IsLoaded())
	{
		spdlog::warn("LibCurl: libcurl loaded but required symbols are missing");
		dlclose(Handle);
		Handle = nullptr;
		return;
	}
	spdlog::info("libcurl version {} loaded", GetLoadedVersion());
}

HLibCurl::~HLibCurl()
{
	if (Handle)
	{
		dlclose(Handle);
	}
}

void HLibCurl::Resolve()
{
#define RESOLVE(sym) sym##_fp = reinterpret_cast<sym##_t>(dlsym(Handle, #sym))
	RESOLVE(curl_easy_init);
	RESOLVE(curl_easy_cleanup);
	RESOLVE(curl_easy_perform);
	RESOLVE(curl_easy_setopt);
	RESOLVE(curl_easy_getinfo);
	RESOLVE(curl_easy_strerror);
	RESOLVE(curl_version);
#undef RESOLVE
}

bool HLibCurl::IsLoaded() const noexcept
{
	return Handle && curl_easy_init_fp && curl_easy_cleanup_fp && curl_easy_perform_fp && curl_easy_setopt_fp
		&& curl_easy_getinfo_fp && curl_easy_strerror_fp;
}

std::string HLibCurl::GetLoadedVersion() const
{
	if (!IsLoaded() || !curl_version_fp)
	{
		return {};
	}
	char const* Version = curl_version_fp();
	return Version ? std::string(Version) : std::string{};
}

std::string HLibCurl::DescribeCode(CURLcode Code) const
{
	char const* Description = curl_easy_strerror_fp(Code);
	return Description ? std::string(Description) : "curl error " + std::to_string(Code);
}

std::string HLibCurl::GetMediaType(std::string const& ContentType)
{
	std::string MediaType = ContentType.substr(0, ContentType.find(';'));
	auto const  Begin = MediaType.find_first_not_of(" \t");
	if (Begin == std::string::npos)
	{
		return {};
	}
	auto const End = MediaType.find_last_not_of(" \t");
	MediaType = MediaType.substr(Begin, End - Begin + 1);
	std::ranges::transform(MediaType, MediaType.begin(), [](unsigned char C) { return std::tolower(C); });
	return MediaType;
}

bool HLibCurl::Get(std::string const& Url, long TimeoutSeconds, HHttpResponse& OutResponse, std::string& OutError) const
{
	CURL* Curl = curl_easy_init_fp();
	if (!Curl)
	{
		OutError = "curl_easy_init failed";
		return false;
	}

	CURLcode Code = kCurlOk;
	auto     SetOpt = [&](int Option, auto Value) {
		Code = curl_easy_setopt_fp(Curl, static_cast<CURLoption>(Option), Value);
		return Code == kCurlOk;
	};

	using HWriteFunction = size_t (*)(char*, size_t, size_t, void*);
	bool const bConfigured = SetOpt(kOptUrl, Url.c_str())
		&& SetOpt(kOptWriteFunction, static_cast<HWriteFunction>(AppendToString))
		&& SetOpt(kOptWriteData, &OutResponse.Body) && SetOpt(kOptUserAgent, "harvester/1.0")
		&& SetOpt(kOptFollowLocation, 1L) && SetOpt(kOptMaxRedirs, 5L) && SetOpt(kOptTimeout, TimeoutSeconds)
		&& SetOpt(kOptConnectTimeout, std::min(TimeoutSeconds, 5L))
		&& SetOpt(kOptAcceptEncoding, ""); // "" enables every supported encoding

	if (bConfigured)
	{
		Code = curl_easy_perform_fp(Curl);
	}

	if (Code == kCurlOk)
	{
		char const* ContentType = nullptr; // owned by the handle
		curl_easy_getinfo_fp(Curl, kInfoResponseCode, &OutResponse.Status);
		curl_easy_getinfo_fp(Curl, kInfoContentType, &ContentType);
		OutResponse.MediaType = ContentType ? GetMediaType(ContentType) : std::string{};
	}
	else
	{
		OutError = DescribeCode(Code);
	}

	curl_easy_cleanup_fp(Curl);
	return Code == kCurlOk;
}

std::string HLibCurl::GetText(std::string const& Url, long TimeoutSeconds, std::string& OutError) const
{
	OutError.clear();
	if (!IsLoaded())
	{
		OutError = "libcurl not loaded";
		return {};
	}

	HHttpResponse Response{};
	if (!Get(Url, TimeoutSeconds, Response, OutError))
	{
		return {};
	}

	if (Response.Status >= 400)
	{
		OutError = "HTTP status " + std::to_string(Response.Status);
		return {};
	}

	if (Response.MediaType != "text/plain")
	{
		OutError = "expected 'text/plain', got '" + Response.MediaType + "'";
		return {};
	}

	spdlog::debug("Fetched {} bytes from {}", Response.Body.size(), Url);
	return std::move(Response.Body);
}
