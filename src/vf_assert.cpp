/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "vf_assert.h"
#include "util.h"
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <string_view>
#include <sys/types.h>
#include <typeinfo>
#include <unistd.h>

BEGIN_NAMESPACE_VF

const char* runtime_error::what() const noexcept
{
	if (!std::empty(buf))
		return buf.c_str();

	const char* const msg = std::runtime_error::what();
	try {
		ccast<decltype(buf)&>(buf) = fmt::format("{}:{}: {}", file, line, msg);
		return buf.c_str();
	} catch (const std::exception&) {
		return msg;
	}
}

bool is_debugger_running()
{
#if defined(__linux__)
	using namespace std::literals;

	int status_fd = open("/proc/self/status", O_RDONLY);
	if (status_fd == -1)
		return false;
	char buf[1024];
	ssize_t num_read = read(status_fd, buf, sizeof(buf) - 1);
	close(status_fd);
	if (num_read <= 0)
		return false;
	buf[num_read] = 0;
	auto tracer = "TracerPid:\t"sv;
	const char* pid = std::strstr(buf, tracer.data());
	if (pid == nullptr)
		return false;
	// Our pid is 0 without a debugger, assume this for any pid starting with 0.
	pid += std::size(tracer);
	return pid < std::end(buf) && *pid != '0';
#else
	return false;
#endif
}

void nested_exception_print(const std::exception& e, int level)
{
	print("{:>{}}: {}\n", typeid(e).name(), std::strlen(typeid(e).name()) + level, e.what());
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception& nested) {
		nested_exception_print(nested, level + 2);
	}
}

END_NAMESPACE_VF
