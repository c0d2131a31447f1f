#include "gateway/network/Buffer.h"

#include <errno.h>
#include <sys/uio.h>
#include <unistd.h>

namespace gateway {
namespace network {

namespace {
const char kCRLF[] = "\r\n";
} // namespace

const char* Buffer::FindCRLF() const {
    const char* crlf = std::search(Peek(), BeginWrite(), kCRLF, kCRLF + 2);
    return crlf == BeginWrite() ? nullptr : crlf;
}

bool Buffer::RetrieveLine(std::string* line) {
    const char* crlf = FindCRLF();
    if (crlf == nullptr) return false;
    line->assign(Peek(), crlf);
    RetrieveUntil(crlf + 2);
    return true;
}

bool Buffer::RetrieveCRLF() {
    if (ReadableBytes() < 2 || Peek()[0] != '\r' || Peek()[1] != '\n') return false;
    Retrieve(2);
    return true;
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char extrabuf[65536];
    struct iovec vec[2];
    const size_t writable = WritableBytes();
    vec[0].iov_base = Begin() + writerIndex_;
    vec[0].iov_len = writable;
    vec[1].iov_base = extrabuf;
    vec[1].iov_len = sizeof extrabuf;
    const int iovcnt = (writable < sizeof extrabuf) ? 2 : 1;
    const ssize_t n = ::readv(fd, vec, iovcnt);
    if (n < 0) {
        *savedErrno = errno;
    } else if (static_cast<size_t>(n) <= writable) {
        writerIndex_ += n;
    } else {
        writerIndex_ = buffer_.size();
        Append(extrabuf, n - writable);
    }
    return n;
}

} // namespace network
} // namespace gateway
