#pragma once

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

/**
 * @file field2d.hpp
 * @brief Contiguous 2D float field with an explicit missing-value marker.
 *
 * Provides row-major storage with `(i,j)` access. A cell is missing when it
 * holds NaN or the field's own `missing_value()` sentinel, so files that use
 * numeric fill values (e.g. -9999) and NaN-filled arrays are handled alike.
 * Used by the globe solver, wet-bulb schemes, WBGT combination and I/O.
 */

class Field2D
{
public:
    /**
     * @brief Constructs an empty field with a NaN missing marker.
     */
    Field2D() : NY_(0), NX_(0), missing_value_(std::numeric_limits<float>::quiet_NaN()) {}

    /**
     * @brief Constructs a zero-initialized field.
     * @param ny Row count.
     * @param nx Column count.
     */
    Field2D(int ny, int nx)
        : NY_(ny), NX_(nx), missing_value_(std::numeric_limits<float>::quiet_NaN())
    {
        data_.resize(checked_size(ny, nx), 0.0f);
    }

    /**
     * @brief Constructs a field filled with a constant value.
     * @param ny Row count.
     * @param nx Column count.
     * @param init_value Fill value.
     * @param missing_value Sentinel marking missing cells (NaN is always missing).
     */
    Field2D(int ny, int nx, float init_value,
            float missing_value = std::numeric_limits<float>::quiet_NaN())
        : NY_(ny), NX_(nx), missing_value_(missing_value)
    {
        data_.resize(checked_size(ny, nx), init_value);
    }

    Field2D(const Field2D& other) = default;
    Field2D& operator=(const Field2D& other) = default;

    Field2D(Field2D&& other) noexcept
        : NY_(other.NY_), NX_(other.NX_), missing_value_(other.missing_value_),
          data_(std::move(other.data_))
    {
        other.NY_ = other.NX_ = 0;
    }

    Field2D& operator=(Field2D&& other) noexcept
    {
        if (this != &other)
        {
            NY_ = other.NY_;
            NX_ = other.NX_;
            missing_value_ = other.missing_value_;
            data_ = std::move(other.data_);
            other.NY_ = other.NX_ = 0;
        }
        return *this;
    }

    /**
     * @brief Creates an all-missing field with the same shape as `shape_source`.
     * @param shape_source Field whose dimensions are copied.
     * @param missing_value Marker written into every cell.
     */
    static Field2D missing_like(const Field2D& shape_source,
                                float missing_value = std::numeric_limits<float>::quiet_NaN())
    {
        return Field2D(shape_source.NY_, shape_source.NX_, missing_value, missing_value);
    }

    /**
     * @brief Builds a field from row-major data.
     * @throws std::invalid_argument when `values.size() != ny*nx`.
     */
    static Field2D from_values(int ny, int nx, std::vector<float> values,
                               float missing_value = std::numeric_limits<float>::quiet_NaN())
    {
        if (values.size() != checked_size(ny, nx))
        {
            throw std::invalid_argument("Field2D::from_values data size does not match shape");
        }
        Field2D out;
        out.NY_ = ny;
        out.NX_ = nx;
        out.missing_value_ = missing_value;
        out.data_ = std::move(values);
        return out;
    }

    /**
     * @brief Resizes and fills field storage with a constant value.
     */
    void resize(int ny, int nx, float init_value)
    {
        const size_t new_size = checked_size(ny, nx);
        NY_ = ny;
        NX_ = nx;
        data_.assign(new_size, init_value);
    }

    void fill(float value) { std::fill(data_.begin(), data_.end(), value); }

    int size_y() const { return NY_; }
    int size_x() const { return NX_; }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    /**
     * @brief Reports whether both fields have identical dimensions.
     */
    bool same_shape(const Field2D& other) const { return NY_ == other.NY_ && NX_ == other.NX_; }

    float missing_value() const { return missing_value_; }

    /**
     * @brief Tests a raw value against this field's missing semantics.
     */
    bool is_missing_value(float value) const
    {
        if (std::isnan(value))
        {
            return true;
        }
        return !std::isnan(missing_value_) && value == missing_value_;
    }

    bool is_missing(int i, int j) const { return is_missing_value((*this)(i, j)); }

    void set_missing(int i, int j) { (*this)(i, j) = missing_value_; }

    /**
     * @brief Counts missing cells.
     */
    size_t missing_count() const
    {
        return static_cast<size_t>(std::count_if(data_.begin(), data_.end(),
                                                 [this](float v) { return is_missing_value(v); }));
    }

    /**
     * @brief Rewrites every missing cell with a new marker and adopts it.
     * @param new_missing Replacement sentinel (NaN allowed).
     */
    void remap_missing(float new_missing)
    {
        for (float& v : data_)
        {
            if (is_missing_value(v))
            {
                v = new_missing;
            }
        }
        missing_value_ = new_missing;
    }

    float* data() { return data_.data(); }
    const float* data() const { return data_.data(); }

    float& operator()(int i, int j) { return data_[flatten_index(i, j)]; }
    const float& operator()(int i, int j) const { return data_[flatten_index(i, j)]; }

private:
    size_t flatten_index(int i, int j) const
    {
        assert(i >= 0 && i < NY_ && j >= 0 && j < NX_);
        return static_cast<size_t>(i) * static_cast<size_t>(NX_) + static_cast<size_t>(j);
    }

    static size_t checked_size(int ny, int nx)
    {
        if (ny < 0 || nx < 0)
        {
            throw std::invalid_argument("Field2D dimensions must be non-negative");
        }

        const size_t ny_sz = static_cast<size_t>(ny);
        const size_t nx_sz = static_cast<size_t>(nx);
        if (ny_sz != 0 && nx_sz > std::numeric_limits<size_t>::max() / ny_sz)
        {
            throw std::overflow_error("Field2D size overflow on ny*nx");
        }
        return ny_sz * nx_sz;
    }

    int NY_;
    int NX_;
    float missing_value_;
    std::vector<float> data_;
};
