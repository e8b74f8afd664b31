// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLRANGETABLE_H
#define QPLLRANGETABLE_H

/**
 * @brief Half-open integer range [low, high)
 */
struct QPllDividerRange
{
    int low;  /**< First valid divider */
    int high; /**< One past the last valid divider */

    constexpr bool contains(int value) const { return value >= low && value < high; }
};

/**
 * @brief Closed frequency range [min, max] in Hz
 */
struct QPllFrequencyRange
{
    double min; /**< Lowest valid frequency */
    double max; /**< Highest valid frequency */

    constexpr bool contains(double value) const { return value >= min && value <= max; }
};

/**
 * @brief Physical operating ranges of the ECP5 EHXPLLL primitive
 * @details Every search variable of the divider solver and every registered
 *          frequency is bounded by these constants. They are fixed for the
 *          device family and never change at runtime.
 */
class QPllRangeTable
{
public:
    static constexpr int MAX_OUTPUTS = 4; /**< CLKOP, CLKOS, CLKOS2, CLKOS3 */

    static constexpr QPllDividerRange CLKI_DIV  = {1, 128 + 1};
    static constexpr QPllDividerRange CLKFB_DIV = {1, 128 + 1};
    static constexpr QPllDividerRange CLKO_DIV  = {1, 128 + 1};

    static constexpr QPllFrequencyRange CLKI_FREQ = {8e6, 400e6};
    static constexpr QPllFrequencyRange CLKO_FREQ = {3.125e6, 400e6};
    static constexpr QPllFrequencyRange VCO_FREQ  = {400e6, 800e6};
    static constexpr QPllFrequencyRange PFD_FREQ  = {10e6, 400e6};

    QPllRangeTable() = delete;
};

#endif // QPLLRANGETABLE_H
