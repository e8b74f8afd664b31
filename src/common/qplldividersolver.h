// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#ifndef QPLLDIVIDERSOLVER_H
#define QPLLDIVIDERSOLVER_H

#include "common/qplloutputrequest.h"

#include <QList>
#include <QString>

#include <cstdint>

/**
 * @brief Divider search engine for the ECP5 PLL
 * @details Enumerates input, feedback-output and feedback dividers in
 *          ascending order and returns the first combination that places
 *          the PFD and VCO in range, resolves every requested output within
 *          its margin and provides a feedback path. The search is first-fit
 *          and deterministic, not optimal.
 */
class QPllDividerSolver
{
public:
    /**
     * @brief Resolved output slot
     */
    struct OutputDivider
    {
        int    div     = 0;     /**< Output divider (CLKO*_DIV) */
        double freq    = 0.0;   /**< Resolved output frequency in Hz, 0 for phantom */
        double phase   = 0.0;   /**< Requested phase in degrees */
        bool   phantom = false; /**< Feedback-only slot added by the solver */
    };

    /**
     * @brief Complete divider configuration
     */
    struct Configuration
    {
        int                  clkiDiv         = 0;     /**< Input divider */
        int                  clkfbDiv        = 0;     /**< Feedback divider */
        int                  clkofbDiv       = 0;     /**< Divider shared with feedback output */
        double               vco             = 0.0;   /**< VCO frequency in Hz */
        int                  feedbackSlot    = -1;    /**< Slot carrying the feedback path */
        bool                 feedbackPhantom = false; /**< Feedback slot was synthesized */
        QList<OutputDivider> outputs;                 /**< One entry per slot, phantom last */
    };

    /**
     * @brief Outcome of evaluating one divider triple
     */
    enum class CandidateStatus : std::uint8_t {
        Valid,   /**< Configuration complete */
        Rejected /**< Try the next combination */
    };

    /**
     * @brief Search for a divider configuration
     * @param inputFreq Reference input frequency in Hz
     * @param outputs Registered outputs in slot order
     * @param dynamicPhaseEnabled Plan-wide dynamic phase adjustment flag
     * @param config Filled with the first valid configuration
     * @return true if found, false if the search space was exhausted
     */
    static bool solve(
        double                       inputFreq,
        const QPllOutputRequestList &outputs,
        bool                         dynamicPhaseEnabled,
        Configuration               &config);

    /**
     * @brief Evaluate one (clkiDiv, clkofbDiv, clkfbDiv) triple
     * @details Checks the VCO range, resolves every output, selects the
     *          feedback source and allocates a phantom feedback slot when no
     *          output qualifies and a slot is free.
     * @param inputFreq Reference input frequency in Hz
     * @param outputs Registered outputs in slot order
     * @param dynamicPhaseEnabled Plan-wide dynamic phase adjustment flag
     * @param clkiDiv Input divider
     * @param clkofbDiv Output divider shared with the feedback tap
     * @param clkfbDiv Feedback divider
     * @param config Filled when the candidate is valid, untouched otherwise
     * @return Valid or Rejected
     */
    static CandidateStatus tryCandidate(
        double                       inputFreq,
        const QPllOutputRequestList &outputs,
        bool                         dynamicPhaseEnabled,
        int                          clkiDiv,
        int                          clkofbDiv,
        int                          clkfbDiv,
        Configuration               &config);

    /**
     * @brief Find the smallest output divider within margin
     * @param vco VCO frequency in Hz
     * @param freq Target output frequency in Hz
     * @param margin Fractional tolerance
     * @param div Set to the divider found
     * @param actual Set to vco / div
     * @return true if some divider satisfies |vco/div - freq| <= freq * margin
     */
    static bool resolveOutputDivider(
        double vco, double freq, double margin, int &div, double &actual);

    /**
     * @brief Check whether an output may carry the feedback path
     * @param output Output request
     * @param dynamicPhaseEnabled Plan-wide dynamic phase adjustment flag
     * @return false when the output takes part in dynamic phase adjustment
     */
    static bool canCarryFeedback(const QPllOutputRequest &output, bool dynamicPhaseEnabled);

    /**
     * @brief Divider of a phantom feedback slot
     * @details Truncates toward zero, so floating error just below an
     *          integer yields the lower divider.
     */
    static int phantomDivider(double vco, double inputFreq, int clkiDiv, int clkfbDiv);

    /**
     * @brief Render a configuration as a one-line summary for logs
     */
    static QString describe(const Configuration &config);
};

#endif // QPLLDIVIDERSOLVER_H
