#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace cbers_tiler {

template <typename T>
class FlatArray2D {
   public:
    FlatArray2D() : width_(0), height_(0) {}

    /**
     * @brief 指定した次元で2D配列を構築
     * @param height 行数
     * @param width 列数
     * @param init_value 全要素の初期値 (デフォルト: 0)
     */
    FlatArray2D(size_t height, size_t width, T init_value = T{})
        : data_(height * width, init_value), width_(width), height_(height) {}

    /**
     * @brief (row, col)の要素にアクセス
     */
    T& operator()(size_t row, size_t col) { return data_[row * width_ + col]; }

    const T& operator()(size_t row, size_t col) const { return data_[row * width_ + col]; }

    /**
     * @brief 行の先頭へのポインタを取得
     *
     * TIFFのタイル/ストリップから行単位でコピーする際に使用:
     * @code
     * std::copy_n(block.data() + offset, count, array.row(y) + x);
     * @endcode
     */
    T* row(size_t row) { return &data_[row * width_]; }

    const T* row(size_t row) const { return &data_[row * width_]; }

    T* data() { return data_.data(); }

    const T* data() const { return data_.data(); }

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    size_t size() const { return data_.size(); }

    /**
     * @brief 全要素が指定値と等しいか確認
     */
    bool all_equal(T value) const {
        return std::all_of(data_.begin(), data_.end(), [value](T v) { return v == value; });
    }

   private:
    std::vector<T> data_;
    size_t width_;
    size_t height_;
};

}  // namespace cbers_tiler
