#pragma once

#include <span>
#include <string>

void write_output(std::span<const char> data, const std::string &output_filename);
