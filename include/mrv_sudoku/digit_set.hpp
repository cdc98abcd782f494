/**
 * @file digit_set.hpp
 * @brief 数字 1..9 の集合（9ビットマスク）
 */
#ifndef MRV_SUDOKU_DIGIT_SET_HPP
#define MRV_SUDOKU_DIGIT_SET_HPP

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mrv_sudoku {

/**
 * @brief マスの値（0 = 空き、1..9 = 数字）
 */
using Digit = int;

/**
 * @brief 数字 1..9 の集合
 *
 * bit (d-1) が数字 d に対応する。空きマスの定義域を表すのに使う。
 */
class DigitSet {
public:
    static constexpr uint16_t ALL_MASK = 0x1FF;

    DigitSet() = default;

    explicit DigitSet(uint16_t mask) : mask_(static_cast<uint16_t>(mask & ALL_MASK)) {}

    /**
     * @brief {1..9} 全体
     */
    static DigitSet all() { return DigitSet(ALL_MASK); }

    bool empty() const { return mask_ == 0; }

    size_t size() const { return std::bitset<9>(mask_).count(); }

    bool contains(Digit digit) const {
        return digit >= 1 && digit <= 9 && (mask_ & bit(digit)) != 0;
    }

    /**
     * @pre 1 <= digit <= 9
     */
    void insert(Digit digit) { mask_ = static_cast<uint16_t>(mask_ | bit(digit)); }

    /**
     * @pre 1 <= digit <= 9
     */
    void remove(Digit digit) { mask_ = static_cast<uint16_t>(mask_ & ~bit(digit)); }

    uint16_t mask() const { return mask_; }

    /**
     * @brief 含まれる数字を昇順で取得
     */
    std::vector<Digit> values() const {
        std::vector<Digit> result;
        result.reserve(size());
        for (Digit d = 1; d <= 9; ++d) {
            if (mask_ & bit(d)) {
                result.push_back(d);
            }
        }
        return result;
    }

    bool operator==(const DigitSet& other) const { return mask_ == other.mask_; }
    bool operator!=(const DigitSet& other) const { return mask_ != other.mask_; }

private:
    static uint16_t bit(Digit digit) { return static_cast<uint16_t>(1u << (digit - 1)); }

    uint16_t mask_ = 0;
};

} // namespace mrv_sudoku

#endif // MRV_SUDOKU_DIGIT_SET_HPP
