/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_FILE_H__
#define __VARIANT_FINDER_FILE_H__

#include "vf_assert.h"
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

struct gzFile_s;

BEGIN_NAMESPACE_VF
using std::string;

bool is_file(const string& path);
string prepend_dir(std::string_view dir, std::string_view filename);

// Returns dir/filename, or dir/filename.gz if only the compressed copy exists.
// Throws file_error if neither exists.
string find_data_file(std::string_view dir, std::string_view filename);

/////////////////////////////////////////////////////////////////////

extern const char* stdin_path; // Special path that causes line_reader to pull from stdin

// Much faster than std::getline
// Results do not include the newline character itself.
class line_reader {
public:
	explicit line_reader(const string& path) { open(path.c_str()); }
	virtual ~line_reader() = default;

	INLINE bool  done() const { return _line == nullptr; }
	INLINE std::string_view line() const {
		auto end = _end;
		while (end > _line && end[-1] == '\0') { --end; }
		return std::string_view(_line, end - _line);
	}
	INLINE line_reader& operator++() { VF_DBASSERT(!done()); advance(); return *this; }
	INLINE long long line_num() const { return _line_num; }

protected:
	line_reader() = default;
	void open(const char* path);
	void advance();
	void refill_and_advance();
	void resize();
	void refill();
	virtual size_t fread(char* dst, unsigned bytes);

	using unique_file = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

	char* _line{};                // start of current line (NULL-terminated)
	char* _end                    // end of current line (NULL terminator);
		{ reinterpret_cast<char*>(-1) }; // -1 causes advance() to hit READ CASE 1 on first call
	char* _bufend{};              // end of valid file bytes in the buffer
	std::unique_ptr<char[]> _buf; // buffer of content currently read from file
	unique_file _fh               // file handle
		{ nullptr, [](auto) { return 0; } };
	long long _line_num{};
};

/////////////////////////////////////////////////////////////////////

// Reads plain files like line_reader, and files ending in .gz through zlib.
class zline_reader: public line_reader {
public:
	explicit zline_reader(const string& path) { open(path.c_str()); }

private:
	void open(const char* path); // not virtual
	size_t fread(char* dst, unsigned bytes) override;

	std::unique_ptr<gzFile_s, int (*)(gzFile_s*)> _zfh // zlib file handle, used if file ends in .gz
		{ nullptr, [](auto) { return 0; } };
};

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_FILE_H__
