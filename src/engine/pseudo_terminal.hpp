#pragma once

#include <string>

namespace compass::engine {

// Owns a master/slave pty pair. The slave is released by the spawning code as
// soon as the child holds it; the master lives until the session is done.
// Both descriptors are close-on-exec.
class PseudoTerminal {
public:
    PseudoTerminal() = default;
    ~PseudoTerminal();

    PseudoTerminal(const PseudoTerminal&) = delete;
    PseudoTerminal& operator=(const PseudoTerminal&) = delete;

    // Returns an error message on failure, empty on success.
    std::string Open(unsigned short rows, unsigned short cols);

    int master() const { return master_; }
    int slave() const { return slave_; }

    void CloseSlave();
    void CloseMaster();

private:
    int master_ = -1;
    int slave_ = -1;
};

}  // namespace compass::engine
