/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

struct HHttpResponse
{
	long        Status{ 0 };
	std::string MediaType{}; // lower case, parameters stripped
	std::string Body{};
};

// libcurl is loaded at runtime, the binary works without it as long as no URL is fetched
class HLibCurl
{
	void* Handle{ nullptr };

	using CURL = void;
	using CURLcode = int;
	using CURLoption = int;
	using CURLINFO = int;

	using curl_easy_init_t = CURL* (*)();
	using curl_easy_cleanup_t = void (*)(CURL*);
	using curl_easy_perform_t = CURLcode (*)(CURL*);
	using curl_easy_setopt_t = CURLcode (*)(CURL*, CURLoption, ...);
	using curl_easy_getinfo_t = CURLcode (*)(CURL*, CURLINFO, ...);
	using curl_easy_strerror_t = char const* (*)(CURLcode);
	using curl_version_t = char const* (*)();

	curl_easy_init_t     curl_easy_init_fp{ nullptr };
	curl_easy_cleanup_t  curl_easy_cleanup_fp{ nullptr };
	curl_easy_perform_t  curl_easy_perform_fp{ nullptr };
	curl_easy_setopt_t   curl_easy_setopt_fp{ nullptr };
	curl_easy_getinfo_t  curl_easy_getinfo_fp{ nullptr };
	curl_easy_strerror_t curl_easy_strerror_fp{ nullptr };
	curl_version_t       curl_version_fp{ nullptr };

	void Resolve();

	[[nodiscard]] std::string DescribeCode(CURLcode Code) const;

	// Blocking GET, any status code counts as success here
	bool Get(std::string const& Url, long TimeoutSeconds, HHttpResponse& OutResponse, std::string& OutError) const;

public:
	void Load();
	HLibCurl() = default;
	~HLibCurl();

	// Non-copyable
	HLibCurl(HLibCurl const&) = delete;
	HLibCurl& operator=(HLibCurl const&) = delete;

	// Returns true if libcurl was successfully loaded.
	bool IsLoaded() const noexcept;

	std::string GetLoadedVersion() const;

	// Fails on HTTP errors and on any media type other than text/plain.
	// OutError is empty on success.
	std::string GetText(std::string const& Url, long TimeoutSeconds, std::string& OutError) const;

	// "Text/Plain; charset=utf-8" -> "text/plain"
	static std::string GetMediaType(std::string const& ContentType);
};
