/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_TESTING_H__
#define __VARIANT_FINDER_TESTING_H__

#include "file.h"
#include "util.h"
#include "vf_assert.h"
#include <string>
#include <string_view>

#ifndef VF_TEST_DATA_DIR
#define VF_TEST_DATA_DIR "tests/data"
#endif

BEGIN_NAMESPACE_VF

inline std::string test_data_path(std::string_view filename)
{
	return prepend_dir(VF_TEST_DATA_DIR, filename);
}

// Fails unless f throws E.
template <typename E, typename F>
void assert_throws(F&& f, std::string_view what)
{
	try {
		f();
	} catch (const E&) {
		return;
	}
	VF_THROW(assertion, "({}): expected an exception", what);
}

#define VF_ASSERT_THROWS(etype, ...) vf::assert_throws<vf::etype##_error>([&]() { (void)(__VA_ARGS__); }, #__VA_ARGS__)

// Runs one test function and reports it by name.
#define VF_RUN_TEST(fn) do { fn(); vf::println("{}: ok", #fn); } while (0)

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_TESTING_H__
