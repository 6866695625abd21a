/**
 * @file npy_io.cpp
 * @brief NPY header decoding and float32 export for 2D fields.
 *
 * The reader accepts only what the pipeline can use: C-order 2D arrays of
 * little-endian float32 or float64. Anything else is reported, never guessed.
 */

#include "npy_io.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <regex>
#include <vector>

namespace wbgt
{
namespace
{

constexpr char kMagic[] = "\x93NUMPY";
constexpr std::size_t kMagicBytes = 6;
constexpr std::size_t kMaxHeaderBytes = 1u << 20;

enum class ElementType
{
    Float32,
    Float64,
    Unsupported,
};

ElementType element_type(const std::string& descr)
{
    if (descr == "<f4" || descr == "|f4" || descr == "=f4")
    {
        return ElementType::Float32;
    }
    if (descr == "<f8" || descr == "=f8")
    {
        return ElementType::Float64;
    }
    return ElementType::Unsupported;
}

bool read_bytes(std::istream& in, void* dst, std::size_t count)
{
    if (count > static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max()))
    {
        return false;
    }
    in.read(static_cast<char*>(dst), static_cast<std::streamsize>(count));
    return static_cast<std::size_t>(in.gcount()) == count;
}

// Header length field: 2 bytes for v1, 4 bytes for v2/v3, little-endian.
std::size_t little_endian_length(const unsigned char* bytes, std::size_t width)
{
    std::size_t value = 0;
    for (std::size_t k = width; k-- > 0;)
    {
        value = (value << 8) | bytes[k];
    }
    return value;
}

/**
 * @brief Captures the value of `'key': <value>` from the header dict.
 * @param value_pattern Regex for the value with exactly one capture group.
 */
bool dict_entry(const std::string& header, const char* key, const char* value_pattern, std::string& out)
{
    const std::regex re(std::string("'") + key + "'\\s*:\\s*" + value_pattern);
    std::smatch match;
    if (!std::regex_search(header, match, re))
    {
        return false;
    }
    out = match[1].str();
    return true;
}

/**
 * @brief Splits a shape tuple body such as "3, 4" or "5," into positive dimensions.
 */
bool parse_dimensions(const std::string& tuple_body, std::vector<int>& dims, std::string& error)
{
    dims.clear();
    std::size_t pos = 0;
    while (pos <= tuple_body.size())
    {
        std::size_t comma = tuple_body.find(',', pos);
        if (comma == std::string::npos)
        {
            comma = tuple_body.size();
        }

        std::size_t first = tuple_body.find_first_not_of(" \t", pos);
        std::size_t last = tuple_body.find_last_not_of(" \t", comma == 0 ? 0 : comma - 1);
        if (first != std::string::npos && first < comma && last != std::string::npos && last >= first)
        {
            const char* begin = tuple_body.data() + first;
            const char* end = tuple_body.data() + last + 1;
            int dim = 0;
            const auto [ptr, ec] = std::from_chars(begin, end, dim);
            if (ec != std::errc() || ptr != end || dim <= 0)
            {
                error = "invalid NPY dimension '" + std::string(begin, end) + "'";
                return false;
            }
            dims.push_back(dim);
        }
        pos = comma + 1;
    }

    if (dims.size() != 2)
    {
        error = "Expected 2D array, got " + std::to_string(dims.size()) + "D";
        return false;
    }
    return true;
}

/**
 * @brief Reads the preamble and header dict, leaving `in` at the payload.
 */
bool read_header(std::istream& in, const std::filesystem::path& path, NpyArrayInfo& info, std::string& error)
{
    unsigned char preamble[kMagicBytes + 2] = {};
    if (!read_bytes(in, preamble, sizeof(preamble)))
    {
        error = "File too short for NPY preamble: " + path.string();
        return false;
    }
    if (std::string(reinterpret_cast<const char*>(preamble), kMagicBytes) != std::string(kMagic, kMagicBytes))
    {
        error = "Invalid NPY magic in " + path.string();
        return false;
    }

    const int major = preamble[kMagicBytes];
    if (major < 1 || major > 3)
    {
        error = "Unsupported NPY version " + std::to_string(major) + "." +
                std::to_string(static_cast<int>(preamble[kMagicBytes + 1])) + " in " + path.string();
        return false;
    }

    const std::size_t width = major == 1 ? 2 : 4;
    unsigned char length_bytes[4] = {};
    if (!read_bytes(in, length_bytes, width))
    {
        error = "Truncated NPY header length in " + path.string();
        return false;
    }
    const std::size_t header_len = little_endian_length(length_bytes, width);
    if (header_len == 0 || header_len > kMaxHeaderBytes)
    {
        error = "NPY header length " + std::to_string(header_len) + " out of range in " + path.string();
        return false;
    }

    std::string header(header_len, '\0');
    if (!read_bytes(in, header.data(), header_len))
    {
        error = "Truncated NPY header in " + path.string();
        return false;
    }

    std::string fortran;
    std::string shape;
    if (!dict_entry(header, "descr", "'([^']+)'", info.descr))
    {
        error = "NPY header has no descr in " + path.string();
        return false;
    }
    if (element_type(info.descr) == ElementType::Unsupported)
    {
        error = "Unsupported NPY dtype '" + info.descr + "' in " + path.string() +
                "; expected little-endian float32 or float64";
        return false;
    }
    if (!dict_entry(header, "fortran_order", "(True|False)", fortran) || fortran != "False")
    {
        error = "Only C-order NPY arrays are supported: " + path.string();
        return false;
    }
    if (!dict_entry(header, "shape", "\\(([^)]*)\\)", shape))
    {
        error = "NPY header has no shape in " + path.string();
        return false;
    }

    std::vector<int> dims;
    if (!parse_dimensions(shape, dims, error))
    {
        error += " in " + path.string();
        return false;
    }
    info.rows = dims[0];
    info.cols = dims[1];
    return true;
}

/**
 * @brief Reads `count` elements of type T and narrows them to float.
 */
template <typename T>
bool read_payload(std::istream& in, std::size_t count, std::vector<float>& values)
{
    if (count > std::numeric_limits<std::size_t>::max() / sizeof(T))
    {
        return false;
    }
    std::vector<T> raw(count);
    if (!read_bytes(in, raw.data(), count * sizeof(T)))
    {
        return false;
    }
    values.assign(raw.begin(), raw.end());
    return true;
}

} // namespace

bool load_npy_field(const std::filesystem::path& path,
                    Field2D& out,
                    float missing_value,
                    std::string& error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        error = "Failed to open file: " + path.string();
        return false;
    }

    NpyArrayInfo info;
    if (!read_header(in, path, info, error))
    {
        return false;
    }

    const std::size_t rows = static_cast<std::size_t>(info.rows);
    const std::size_t cols = static_cast<std::size_t>(info.cols);
    if (rows > std::numeric_limits<std::size_t>::max() / cols)
    {
        error = "NPY shape overflows size_t in " + path.string();
        return false;
    }

    std::vector<float> values;
    const bool ok = element_type(info.descr) == ElementType::Float64
                        ? read_payload<double>(in, rows * cols, values)
                        : read_payload<float>(in, rows * cols, values);
    if (!ok)
    {
        error = "Truncated NPY payload in " + path.string();
        return false;
    }

    out = Field2D::from_values(info.rows, info.cols, std::move(values), missing_value);
    return true;
}

bool load_npy_info(const std::filesystem::path& path, NpyArrayInfo& out, std::string& error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        error = "Failed to open file: " + path.string();
        return false;
    }
    return read_header(in, path, out, error);
}

/** @brief Writes a v1.0 `<f4` file; header padded so the payload starts on a 16-byte boundary. */
bool write_npy_field(const Field2D& field, const std::filesystem::path& path, std::string& error)
{
    if (field.empty())
    {
        error = "refusing to write empty field to " + path.string();
        return false;
    }

    std::string dict = "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
                       std::to_string(field.size_y()) + ", " + std::to_string(field.size_x()) + "), }";
    const std::size_t fixed = kMagicBytes + 2 + 2;
    while ((fixed + dict.size() + 1) % 16 != 0)
    {
        dict.push_back(' ');
    }
    dict.push_back('\n');

    if (dict.size() > std::numeric_limits<std::uint16_t>::max())
    {
        error = "NPY header too long for format 1.0: " + path.string();
        return false;
    }

    std::string preamble(kMagic, kMagicBytes);
    preamble.push_back(static_cast<char>(1));
    preamble.push_back(static_cast<char>(0));
    preamble.push_back(static_cast<char>(dict.size() & 0xFF));
    preamble.push_back(static_cast<char>((dict.size() >> 8) & 0xFF));

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        error = "Failed to open file for writing: " + path.string();
        return false;
    }
    out << preamble << dict;
    out.write(reinterpret_cast<const char*>(field.data()),
              static_cast<std::streamsize>(field.size() * sizeof(float)));
    if (!out.good())
    {
        error = "Failed to write NPY payload to " + path.string();
        return false;
    }
    return true;
}

} // namespace wbgt
