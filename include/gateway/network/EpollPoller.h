#pragma once

#include "gateway/common/noncopyable.h"

#include <chrono>
#include <unordered_map>
#include <vector>
#include <sys/epoll.h>

namespace gateway {
namespace network {

class Channel;

// Level-triggered epoll demultiplexer owned by one EventLoop.
class EpollPoller : gateway::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* activeChannels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int numEvents, ChannelList* activeChannels) const;
    void Update(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace gateway
