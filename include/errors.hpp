#pragma once

#include <stdexcept>
#include <string>

namespace cbers_tiler {

// ライブラリ内で送出される例外の基底クラス
class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// シーンIDの書式が不正
class ParseError : public Error {
   public:
    using Error::Error;
};

// アセットが存在しない、または読み取れない
class IOError : public Error {
   public:
    using Error::Error;
};

/**
 * @brief 要求タイルがシーン範囲外
 *
 * 呼び出し側は「このタイルにはデータが無い」という通常の結果として扱う。
 */
class TileOutsideBounds : public Error {
   public:
    using Error::Error;
};

}  // namespace cbers_tiler
