//
// Created by usr on 09/10/2025.
//

#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace stdfs = std::filesystem;

class HFilesystem
{
	static std::string LastError() { return std::string(strerror(errno)); }

public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code ec;
		return stdfs::exists(p, ec);
	}

	static bool ReadFile(stdfs::path const& Path, std::string& OutData, std::string& OutError)
	{
		std::ifstream FileStream(Path, std::ios::in | std::ios::binary);
		if (!FileStream)
		{
			OutError = "can't open '" + Path.string() + "': " + LastError();
			return false;
		}

		std::ostringstream ss;
		ss << FileStream.rdbuf();
		OutData = ss.str();
		return true;
	}

	static bool WriteBinary(stdfs::path const& Path, std::string const& Data, std::string& OutError)
	{
		std::ofstream FileStream(Path, std::ios::out | std::ios::binary | std::ios::trunc);
		if (!FileStream)
		{
			OutError = "can't open '" + Path.string() + "' for writing: " + LastError();
			return false;
		}
		FileStream.write(Data.data(), static_cast<std::streamsize>(Data.size()));
		if (!FileStream)
		{
			OutError = "failed to write '" + Path.string() + "'";
			return false;
		}
		return true;
	}

	static bool EnsureDirectory(stdfs::path const& Path, std::string& OutError)
	{
		std::error_code ec;
		if (stdfs::is_directory(Path, ec))
		{
			return true;
		}
		if (!stdfs::create_directories(Path, ec) && ec)
		{
			OutError = "failed to create directory '" + Path.string() + "': " + ec.message();
			return false;
		}
		return true;
	}

	// Writes Data next to Path and renames it over Path, readers never see a partial file
	static bool ReplaceFile(stdfs::path const& Path, std::string const& Data, std::string& OutError)
	{
		stdfs::path TempPath = Path;
		TempPath += ".tmp";

		if (!WriteBinary(TempPath, Data, OutError))
		{
			return false;
		}

		std::error_code ec;
		stdfs::rename(TempPath, Path, ec);
		if (ec)
		{
			OutError = "failed to replace '" + Path.string() + "': " + ec.message();
			stdfs::remove(TempPath, ec);
			return false;
		}
		return true;
	}
};
