#pragma once

#include <lzstream/core/history_window.h>
#include <lzstream/defs/lzstream_defs.h>

#include <cstddef>
#include <variant>

/**
 * @class c_lz77_engine
 * @brief Expands one token at a time into bytes, one byte per step.
 *
 * A token with length 0 is accepted and its literal emitted in the same step. A token
 * with length n > 0 is latched in one step, then emits n copy bytes over n steps and
 * its literal in the step after. Every emitted byte is appended to the history window,
 * so overlapping back-references (distance < length) replicate a repeating pattern.
 */
class c_lz77_engine final
{
public:
    struct idle_t
    {
    };

    struct copying_t
    {
        size_t copy_cursor; /**< window slot the next copy byte is read from. */
        size_t remaining; /**< copy bytes still to emit. */
        unsigned char literal;
    };

    struct emit_literal_t
    {
        unsigned char literal;
    };

    using state_t = std::variant< idle_t, copying_t, emit_literal_t >;

    /**
     * @struct step_t
     * @brief What happened during one step.
     */
    struct step_t
    {
        bool accepted; /**< the offered token was consumed. */
        bool produced; /**< `value` holds an output byte. */
        unsigned char value;
    };

    explicit
    c_lz77_engine( unsigned int window_bits );

    /**
     * @brief True while the engine can accept a new token.
     */
    bool
    ready() const;

    /**
     * @brief Advances the engine by one step.
     *
     * @param offer Token presented by the producer, or nullptr. Only consumed while ready.
     * @return The handshake result and the byte produced this step, if any.
     */
    step_t
    step( const lz_token_t *offer );

    void
    reset();

    const state_t &
    state() const;

    const c_history_window &
    history() const;

private:
    c_history_window window;
    state_t current;

    unsigned char
    emit( unsigned char value );
};
