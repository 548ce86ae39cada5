/** \file
 *
 * \brief Definition of Shuffling::Engine::MoveEmitter interface and its
 * implementations
 */

#ifndef ENGINE_MOVEEMITTER_HH_
#define ENGINE_MOVEEMITTER_HH_

#include "engine/TransformationRecord.hh"
#include "shuffling/Deck.hh"

#include <boost/core/noncopyable.hpp>

#include <cstddef>

namespace Shuffling {
namespace Engine {

/** \brief Sink for the steps of a shuffle algorithm
 *
 * Each shuffle algorithm is implemented once, as a producer of
 * TransformationRecord objects that it emits to a MoveEmitter. Whether the
 * steps are applied immediately (bulk mode) or collected for later playback
 * (step mode) is decided by the emitter. Because both modes run the very
 * same code and consume the same random draws, they cannot diverge.
 */
class MoveEmitter : private boost::noncopyable {
public:

    virtual ~MoveEmitter();

    /** \brief Emit a step
     *
     * \param record the step
     *
     * \throw InvariantViolationException if the record cannot be applied to
     * the deck the emitter works on
     */
    void emit(TransformationRecord record);

    /** \brief Get the number of steps emitted so far
     */
    std::size_t getNumberOfSteps() const;

private:

    /** \brief Handle for emitting a step
     *
     * \sa emit()
     */
    virtual void handleEmit(TransformationRecord record) = 0;

    std::size_t nSteps {};
};

/** \brief Move emitter that applies the steps immediately
 */
class BulkMoveEmitter : public MoveEmitter {
public:

    /** \brief Create bulk move emitter
     *
     * \param deck the initial deck
     */
    explicit BulkMoveEmitter(Deck deck);

    /** \brief Get the deck with every step so far applied
     *
     * \return the deck, with positions renumbered and highlights cleared
     */
    Deck getDeck() const;

private:

    void handleEmit(TransformationRecord record) override;

    Deck deck;
};

/** \brief Move emitter that collects the steps
 */
class RecordingMoveEmitter : public MoveEmitter {
public:

    /** \brief Create recording move emitter
     *
     * \param size the size of the deck the steps will be applied to
     */
    explicit RecordingMoveEmitter(std::size_t size);

    /** \brief Get the steps emitted so far, in order
     */
    const TransformationRecordVector& getRecords() const;

private:

    void handleEmit(TransformationRecord record) override;

    std::size_t size;
    TransformationRecordVector records;
};

}
}

#endif // ENGINE_MOVEEMITTER_HH_
