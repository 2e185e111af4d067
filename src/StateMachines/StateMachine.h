#ifndef STATEMACHINE_H
#define STATEMACHINE_H
#include <string>

/**
 * A simple abstract class for the state that committed log entries are
 * applied to. Each command prompts an internal state transition and the
 * return of an output in string form.
 *
 * Correct implementations are deterministic: applying the same commands in the
 * same order from the same initial state should always result in the same
 * end state. The RAFT node guarantees which commands are applied and in what
 * order; what they mean is entirely up to the implementation.
 */
class StateMachine {
  public:
    virtual ~StateMachine() = default;
    virtual std::string apply(std::string command) = 0;
};
#endif /* !STATEMACHINE_H */
