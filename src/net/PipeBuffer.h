#pragma once

#include <cstddef>

/// Outcome of one PipeBuffer::transfer() step.
enum class TransferStatus {
    Open,      // would block; wait for the next readiness event
    Complete,  // source reached EOF and every buffered byte was delivered
    Failed     // I/O error on either socket; `error` holds the errno
};

struct TransferResult {
    TransferStatus status = TransferStatus::Open;
    int error = 0;

    /// Complete and Failed both end the connection.
    bool terminal() const { return status != TransferStatus::Open; }
};

/// Creates a throwaway pipe and returns its capacity (F_GETPIPE_SZ).
/// Called once at startup. Throws std::system_error on failure.
size_t probePipeCapacity();

/// A bounded in-kernel byte buffer for one transfer direction.
///
/// Bytes move socket -> pipe -> socket with splice(), so the payload never
/// enters user space. buffered_ mirrors the number of bytes sitting in the
/// pipe; the kernel is the only place the data lives.
///
/// Invariant: 0 <= buffered() <= capacity().
/// Not copyable, not movable. Owned by exactly one Connection.
class PipeBuffer {
public:
    /// Opens a non-blocking pipe. Throws std::system_error if pipe2() fails.
    explicit PipeBuffer(size_t capacity);

    /// Closes both pipe ends. Anything still buffered is discarded.
    ~PipeBuffer();

    PipeBuffer(const PipeBuffer&) = delete;
    PipeBuffer& operator=(const PipeBuffer&) = delete;

    /// Splice from srcFd into the pipe until the buffer is full, srcFd would
    /// block, or srcFd reports EOF (zero-length read). `eof` is set once the
    /// source has half-closed and stays set afterwards.
    /// Returns 0, or the errno of the first hard failure.
    int drainIn(int srcFd, bool& eof);

    /// Splice buffered bytes into dstFd until the buffer is empty or dstFd
    /// would block. Returns 0, or the errno of the first hard failure.
    int drainOut(int dstFd);

    /// One transfer step: drainIn from srcFd, then drainOut to dstFd while
    /// anything is buffered. Repeats while the previous round emptied the
    /// buffer after moving bytes, so an edge-triggered source that stopped
    /// only because the pipe filled up is not left with unread data.
    TransferResult transfer(int srcFd, int dstFd);

    bool isEmpty() const { return buffered_ == 0; }
    size_t buffered() const { return buffered_; }
    size_t capacity() const { return capacity_; }
    bool sourceClosed() const { return eof_; }

private:
    size_t capacity_;
    size_t buffered_ = 0;
    bool eof_ = false;
    int readFd_ = -1;   // pipe read end, spliced out to the destination
    int writeFd_ = -1;  // pipe write end, spliced in from the source
};
