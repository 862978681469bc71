#pragma once

#include <string>
#include <vector>

#include "core/device.h"

namespace step_params {

// Values may be authored quoted ("1.A"); quotes and surrounding blanks are stripped.
std::string clean(const std::string& raw);

bool has(const ParamMap& params, const char* key);

bool get_string(const ParamMap& params, const char* key, std::string& out, Fault* fault);
bool get_float(const ParamMap& params, const char* key, float& out, Fault* fault);
bool get_int(const ParamMap& params, const char* key, int& out, Fault* fault);

// Missing, empty, "None" or "null" leave present=false.
bool get_optional_float(const ParamMap& params, const char* key, float& out, bool& present,
                        Fault* fault);

// Splits "1.A, 1.B" or "1.A 1.B" into items.
std::vector<std::string> split_list(const std::string& raw);

// Fails with a configuration fault when a non-optional parameter of `info` is missing.
bool check_required(const CommandInfo& info, const ParamMap& params, Fault* fault);

} // namespace step_params
