#include "net/PipeBuffer.h"

#include <cassert>
#include <cerrno>
#include <cstdio>
#include <system_error>
#include <fcntl.h>    // pipe2, splice, F_GETPIPE_SZ
#include <unistd.h>   // close

size_t probePipeCapacity() {
    int pfd[2];
    if (::pipe2(pfd, O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2()");
    }
    int size = ::fcntl(pfd[0], F_GETPIPE_SZ);
    int savedErrno = errno;
    ::close(pfd[0]);
    ::close(pfd[1]);
    if (size <= 0) {
        throw std::system_error(savedErrno, std::generic_category(),
                                "fcntl(F_GETPIPE_SZ)");
    }
    return static_cast<size_t>(size);
}

PipeBuffer::PipeBuffer(size_t capacity)
    : capacity_(capacity) {
    int pfd[2];
    // Both ends non-blocking: a full or empty pipe must surface as EAGAIN,
    // never stall the event loop.
    if (::pipe2(pfd, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2()");
    }
    readFd_  = pfd[0];
    writeFd_ = pfd[1];
    std::printf("PipeBuffer: new %d+%d\n", readFd_, writeFd_);
}

PipeBuffer::~PipeBuffer() {
    std::printf("PipeBuffer: drop %d+%d\n", readFd_, writeFd_);
    if (readFd_ >= 0) {
        ::close(readFd_);
    }
    if (writeFd_ >= 0) {
        ::close(writeFd_);
    }
}

int PipeBuffer::drainIn(int srcFd, bool& eof) {
    while (buffered_ < capacity_) {
        ssize_t n = ::splice(srcFd, nullptr, writeFd_, nullptr,
                             capacity_ - buffered_,
                             SPLICE_F_MOVE | SPLICE_F_NONBLOCK);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;  // Source drained or pipe full; wait for next edge.
            }
            eof = eof_;
            return errno;
        }
        if (n == 0) {
            // Peer half-closed its write side.
            eof_ = true;
            break;
        }
        buffered_ += static_cast<size_t>(n);
        // INV: splice never returns more than the requested length.
        assert(buffered_ <= capacity_);
    }
    eof = eof_;
    return 0;
}

int PipeBuffer::drainOut(int dstFd) {
    while (buffered_ > 0) {
        ssize_t n = ::splice(readFd_, nullptr, dstFd, nullptr, buffered_,
                             SPLICE_F_MOVE | SPLICE_F_NONBLOCK);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;  // Destination socket buffer is full.
            }
            return errno;
        }
        if (n == 0) {
            break;
        }
        assert(static_cast<size_t>(n) <= buffered_);
        buffered_ -= static_cast<size_t>(n);
    }
    return 0;
}

TransferResult PipeBuffer::transfer(int srcFd, int dstFd) {
    while (true) {
        size_t before = buffered_;
        bool eof = false;
        int err = drainIn(srcFd, eof);
        if (err != 0) {
            return {TransferStatus::Failed, err};
        }
        bool movedIn = buffered_ > before;
        bool movedOut = false;

        if (!isEmpty()) {
            size_t pending = buffered_;
            err = drainOut(dstFd);
            if (err != 0) {
                return {TransferStatus::Failed, err};
            }
            movedOut = buffered_ < pending;
        }

        if (eof && isEmpty()) {
            return {TransferStatus::Complete, 0};
        }

        // Destination is backed up (its EPOLLOUT edge will resume us), or
        // nothing moved at all: the source has no more data right now.
        if (!isEmpty() || (!movedIn && !movedOut)) {
            return {TransferStatus::Open, 0};
        }
    }
}
