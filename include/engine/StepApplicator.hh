/** \file
 *
 * \brief Definition of utilities for replaying transformation records
 */

#ifndef ENGINE_STEPAPPLICATOR_HH_
#define ENGINE_STEPAPPLICATOR_HH_

#include "engine/TransformationRecord.hh"
#include "shuffling/Deck.hh"

#include <cstddef>

namespace Shuffling {
namespace Engine {

/** \brief Check that a record can be applied to a deck of given size
 *
 * \param record the record
 * \param size the size of the deck
 *
 * \throw InvariantViolationException if \p record refers to an index outside
 * the deck, its source and destination have different lengths or repeat an
 * index, or it is a swap that does not exchange exactly two indices
 */
void checkRecord(const TransformationRecord& record, std::size_t size);

/** \brief Reorder a deck as encoded by a record
 *
 * Unlike applyStep(), this function neither renumbers positions nor touches
 * highlights. It is the primitive shared by the bulk and step modes of the
 * shuffle algorithms.
 *
 * \param deck the deck
 * \param record the record, which must already have been checked with
 * checkRecord()
 *
 * \return the reordered deck
 */
Deck reorder(Deck deck, const TransformationRecord& record);

/** \brief Apply one transformation record to a deck
 *
 * The cards are reordered as encoded by \p record, positions are renumbered
 * to match the new order, and exactly the cards at the indices listed in
 * TransformationRecord::affectedIndices are highlighted.
 *
 * \param deck the deck
 * \param record the record
 *
 * \return the resulting deck
 *
 * \throw InvalidInputException if \p deck is empty
 * \throw InvariantViolationException if \p record cannot be applied to \p
 * deck
 *
 * \sa checkRecord()
 */
Deck applyStep(const Deck& deck, const TransformationRecord& record);

/** \brief Rebuild the state of a deck after a number of steps
 *
 * Playback of a recorded shuffle carries no hidden cursor. Resuming from step
 * \p count is done by replaying the first \p count records against the
 * pristine original deck.
 *
 * \param original the deck the records were recorded from
 * \param records the records
 * \param count the number of records to apply
 *
 * \return the deck after applying the first \p count records, or \p original
 * with cleared highlights if \p count is zero
 *
 * \throw InvalidInputException if \p count exceeds the number of records
 * \throw InvariantViolationException if a record cannot be applied
 */
Deck replaySteps(
    const Deck& original, const TransformationRecordVector& records,
    std::size_t count);

}
}

#endif // ENGINE_STEPAPPLICATOR_HH_
