#include "engine/pseudo_terminal.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace compass::engine {
namespace {

void SetCloseOnExec(int fd) {
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

}  // namespace

PseudoTerminal::~PseudoTerminal() {
    CloseSlave();
    CloseMaster();
}

std::string PseudoTerminal::Open(unsigned short rows, unsigned short cols) {
    struct winsize size {};
    size.ws_row = rows;
    size.ws_col = cols;
    if (::openpty(&master_, &slave_, nullptr, nullptr, &size) != 0) {
        master_ = -1;
        slave_ = -1;
        return std::strerror(errno);
    }
    SetCloseOnExec(master_);
    SetCloseOnExec(slave_);
    return std::string();
}

void PseudoTerminal::CloseSlave() {
    if (slave_ >= 0) {
        ::close(slave_);
        slave_ = -1;
    }
}

void PseudoTerminal::CloseMaster() {
    if (master_ >= 0) {
        ::close(master_);
        master_ = -1;
    }
}

}  // namespace compass::engine
