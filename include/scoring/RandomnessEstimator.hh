/** \file
 *
 * \brief Definition of the randomness estimator
 *
 * The estimator scores how well a shuffle mixed a deck by comparing the
 * positions of each card before and after the shuffle. The scores are
 * advisory. Invalid input never causes an exception, but yields a score of
 * zero.
 */

#ifndef SCORING_RANDOMNESSESTIMATOR_HH_
#define SCORING_RANDOMNESSESTIMATOR_HH_

#include "shuffling/Deck.hh"

#include <boost/operators.hpp>

#include <iosfwd>

namespace Shuffling {
namespace Scoring {

/** \brief Compute the displacement score of a shuffle
 *
 * Let \c d be the distance between the original and the new index of a card.
 * The score is <tt>round(100 * (0.6 * f + 0.4 * m))</tt>, where \c f is the
 * fraction of cards with nonzero \c d and \c m is the mean of \c d divided by
 * <tt>N / 2</tt>, capped at 1.
 *
 * The score is symmetric in its arguments and does not depend on how the
 * cards are labeled.
 *
 * \param original the deck before the shuffle
 * \param shuffled the deck after the shuffle
 *
 * \return the score between 0 and 100, or 0 if the decks are empty or do not
 * contain the same cards
 */
int displacementScore(const Deck& original, const Deck& shuffled);

/** \brief Compute the entropy score of a shuffle
 *
 * Builds a histogram of the displacements \c d of the cards, with one bucket
 * for each integer from zero to the largest displacement, and computes the
 * Shannon entropy of the resulting distribution, normalized by the base 2
 * logarithm of the number of buckets.
 *
 * The score is symmetric in its arguments and does not depend on how the
 * cards are labeled.
 *
 * \param original the deck before the shuffle
 * \param shuffled the deck after the shuffle
 *
 * \return the score between 0 and 100, or 0 if no card was displaced, the
 * decks are empty or they do not contain the same cards
 */
double entropyScore(const Deck& original, const Deck& shuffled);

/** \brief Estimate the randomness of a shuffle
 *
 * This is the score the statistics aggregate.
 *
 * \return displacementScore(original, shuffled)
 */
int estimateRandomness(const Deck& original, const Deck& shuffled);

/** \brief Summary of the randomness of a shuffle
 *
 * RandomnessEstimate objects are equality comparable. They compare equal when
 * all their fields are equal.
 */
struct RandomnessEstimate : private boost::equality_comparable<RandomnessEstimate> {
    int displacementScore;  ///< \brief See Scoring::displacementScore()
    double entropyScore;    ///< \brief See Scoring::entropyScore()
    int suitRuns;           ///< \brief See Shuffling::countSuitRuns()

    RandomnessEstimate() = default;

    /** \brief Create new randomness estimate
     *
     * \param displacementScore the displacement score
     * \param entropyScore the entropy score
     * \param suitRuns the number of suit runs
     */
    constexpr RandomnessEstimate(
        int displacementScore, double entropyScore, int suitRuns) :
        displacementScore {displacementScore},
        entropyScore {entropyScore},
        suitRuns {suitRuns}
    {
    }
};

/** \brief Compute all randomness measures of a shuffle
 *
 * \param original the deck before the shuffle
 * \param shuffled the deck after the shuffle
 */
RandomnessEstimate estimate(const Deck& original, const Deck& shuffled);

/** \brief Equality operator for randomness estimates
 */
bool operator==(const RandomnessEstimate&, const RandomnessEstimate&);

/** \brief Output a RandomnessEstimate to stream
 *
 * \param os the output stream
 * \param estimate the estimate to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const RandomnessEstimate& estimate);

}
}

#endif // SCORING_RANDOMNESSESTIMATOR_HH_
