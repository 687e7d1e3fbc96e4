#include <string_view>

#include <fcntl.h>
#include <fmt/os.h>

#include "output.hpp"
#include "timer.hpp"

void write_output(std::span<const char> data, const std::string &output_filename)
{
    fmt::print("Saving downloaded data to '{}'\n", output_filename);
    Timer t;
    {
        auto out = fmt::output_file(
            output_filename, fmt::file::WRONLY | fmt::file::CREATE | O_TRUNC);
        out.print("{}", std::string_view(data.data(), data.size()));
    }
    fmt::print("File saved successfully in {}\n", t.get_fmt());
}
