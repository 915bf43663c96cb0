/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "util.h"
#include "strutil.h"

BEGIN_NAMESPACE_VF

static log_level_t g_log_level = log_level_t::warn;

log_level_t get_log_level() { return g_log_level; }
void set_log_level(log_level_t level) { g_log_level = level; }

static const char* const g_log_level_names[] = { "debug", "info", "warn", "error", "quiet" };

log_level_t as_log_level(std::string_view s)
{
	s = strip(s);
	for (size_t i = 0; i < std::size(g_log_level_names); ++i)
		if (s == g_log_level_names[i])
			return scast<log_level_t>(i);
	VF_THROW(value, "Unrecognized log level \"{}\", expected one of debug, info, warn, error, quiet.", s);
}

const char* log_level_as_str(log_level_t level)
{
	VF_DBASSERT(as_ordinal(level) < std::size(g_log_level_names));
	return g_log_level_names[as_ordinal(level)];
}

END_NAMESPACE_VF
