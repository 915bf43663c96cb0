/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_VF_ASSERT_H__
#define __VARIANT_FINDER_VF_ASSERT_H__

#include "defines.h"
#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <stdexcept>
#include <string>

#define VF_ENABLE_DEBUGBREAK  // Comment this out to disable debugbreak at outset of every VF_THROW or failed VF_ASSERT/VF_CHECK

BEGIN_NAMESPACE_VF

static const auto vf_debugbreak = getenv("VF_DEBUGBREAK") != nullptr;

class runtime_error : public std::runtime_error {
public:
	runtime_error(const char* msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	runtime_error(const std::string& msg, const char* file, int line): std::runtime_error(msg), file(file), line(line) {}
	const char* what() const noexcept;

private:
	std::string buf;
	const char* file;
	int         line;
};

#define VF_DECL_ERROR_CLASS(error_class, base_class) \
	class error_class : public base_class { \
	public: \
		error_class(const char* msg, const char* file, int line): base_class(msg, file, line) { } \
		error_class(const std::string& msg, const char* file, int line): base_class(msg, file, line) { } \
	};

VF_DECL_ERROR_CLASS(assertion_error, runtime_error)
VF_DECL_ERROR_CLASS(file_error,      runtime_error)
VF_DECL_ERROR_CLASS(value_error,     runtime_error)
VF_DECL_ERROR_CLASS(index_error,     runtime_error)
VF_DECL_ERROR_CLASS(key_error,       runtime_error)
VF_DECL_ERROR_CLASS(not_implemented_error,  runtime_error)
VF_DECL_ERROR_CLASS(unreachable_code_error, runtime_error)
// Malformed pattern table row or configuration entry
VF_DECL_ERROR_CLASS(config_error,    runtime_error)
// Reference sequence disagrees with the residues a variant claims to change
VF_DECL_ERROR_CLASS(consistency_error, runtime_error)

extern bool is_debugger_running();

#ifdef VF_ENABLE_DEBUGBREAK
	// When a debugger is running and VF_DEBUGBREAK is set, VF_THROW, VF_CHECK,
	// and VF_ASSERT trigger a debug break before throwing an exception.
	#if defined(__clang__)
		#define VF_DEBUGBREAK { if (vf_debugbreak && vf::is_debugger_running()) __builtin_debugtrap(); }
	#elif defined(__GNUC__)
		#define VF_DEBUGBREAK { if (vf_debugbreak && vf::is_debugger_running()) __builtin_trap(); }
	#else
		#error Unsupported compiler.
	#endif
#else
	#define VF_DEBUGBREAK // disabled
#endif

//! \brief Throw a VF exception of the specified type.
//!
//! VF_THROW(etype, msg) throws an exception with a custom
//! string appended to the error message.
//!
//! VF_THROW(etype, msg, ...) throws an exception with a custom
//! formatted string appended to the error message. The format
//! for the message is the same as fmt::format(msg, ...).
//!
#define VF_MAKE_ERROR(etype, msg, ...) \
	vf::etype##_error(fmt::format(msg __VA_OPT__(, ) __VA_ARGS__), __FILE__, __LINE__)
#define VF_THROW(etype, ...) throw VF_MAKE_ERROR(etype, __VA_ARGS__)
#define VF_CATCH_THROW_NESTED(etype, ...) \
	catch (const vf::etype##_error&) \
	{ \
		std::throw_with_nested(VF_MAKE_ERROR(etype, __VA_ARGS__)); \
	}
#define VF_DEBUGBREAK_THROW(etype, ...) \
	VF_DEBUGBREAK; \
	VF_THROW(etype, __VA_ARGS__)
#define VF_LIKELY_OR(cond, expr) \
	do { \
		if (LIKELY(cond)) { \
		} else { \
			expr; \
		} \
	} while (0)

// ordered from derived -> base
#define VF_RETHROW(...) \
	VF_CATCH_THROW_NESTED(assertion, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(file, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(value, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(index, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(key, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(not_implemented, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(unreachable_code, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(config, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(consistency, __VA_ARGS__) \
	VF_CATCH_THROW_NESTED(runtime, __VA_ARGS__)

//! \brief If expr is false, throw an assertion_error.
//!
//! VF_ASSERT(expr) throws an assertion_error if expr evaluates to
//! false. The failed expression is appended to the error message.
//!
//! VF_ASSERT(expr, msg, ...) throws if expr fails, but appends
//! a custom formatted string to the error message.
//!
#define VF_ASSERT(expr, ...) VF_LIKELY_OR(expr, VF_DEBUGBREAK_THROW(assertion, "({}): " VF_VA_HEAD(__VA_ARGS__), #expr VF_VA_COMMA_TAIL(__VA_ARGS__)))

//! \brief If expr is false, throw a specific type of exception.
//!
//! VF_CHECK(expr, etype, msg, ...) throws if expr fails, with
//! a custom formatted string as the error message.
//!
#define VF_CHECK(expr, etype, ...)  VF_LIKELY_OR(expr, VF_DEBUGBREAK_THROW(etype, __VA_ARGS__))

//! \brief Throw an unreachable_code_error exception.
#define VF_UNREACHABLE()            do { VF_DEBUGBREAK_THROW(unreachable_code, ""); } while (0)

#ifdef VF_DEBUG
#ifndef VF_ENABLE_DBASSERT
#define VF_ENABLE_DBASSERT
#endif
#endif

#ifdef VF_ENABLE_DBASSERT
#define VF_DBASSERT(...)      VF_ASSERT(__VA_ARGS__)
#else
#define VF_DBASSERT(...)      { }
#endif

// Prints an exception and every exception nested inside it, one per line.
void nested_exception_print(const std::exception& e, int level = 0);

END_NAMESPACE_VF

#endif  // __VARIANT_FINDER_VF_ASSERT_H__
