/**
 * @file npy_io.hpp
 * @brief NPY reader and writer for 2D float fields.
 *
 * Reads C-order NumPy `.npy` payloads with little-endian float32 or float64
 * dtype (format versions 1 to 3) into a Field2D, and writes Field2D values
 * as version 1.0 float32 arrays.
 */

#pragma once

#include <filesystem>
#include <string>

#include "field2d.hpp"

namespace wbgt
{

/**
 * @brief Shape and dtype metadata of a 2D NPY array.
 */
struct NpyArrayInfo
{
    int rows = 0;
    int cols = 0;
    std::string descr;
};

/**
 * @brief Load a 2D NPY array into a field.
 * @param path Source file path.
 * @param out Destination field; reshaped to the file shape.
 * @param missing_value Sentinel adopted by `out` (NaN is always missing).
 * @param error Output message on failure.
 * @return `true` on success.
 */
bool load_npy_field(const std::filesystem::path& path,
                    Field2D& out,
                    float missing_value,
                    std::string& error);

/**
 * @brief Read only the header metadata of a 2D NPY file.
 * @return `true` on success.
 */
bool load_npy_info(const std::filesystem::path& path, NpyArrayInfo& out, std::string& error);

/**
 * @brief Write a field as a 2D float32 NPY file.
 * @param field Source field; written row-major as stored.
 * @param path Destination path.
 * @param error Output message on failure.
 * @return `true` on success.
 */
bool write_npy_field(const Field2D& field, const std::filesystem::path& path, std::string& error);

} // namespace wbgt
