#pragma once

#include <cstdint>
#include <mutex>
#include <queue>
#include <string>

// Framed responses written by worker threads and flushed by the event loop.
// Each item carries the id of the connection it answers, so a response whose
// connection closed is dropped even when the kernel has reused the fd.
class ResponseQueue
{
public:
    struct Item
    {
        int fd;
        std::uint64_t connection_id;
        std::string data;
    };

    void push(int fd, std::uint64_t connection_id, std::string data)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push({fd, connection_id, std::move(data)});
    }

    // Drains the queue into `connections` (fd -> object with an `id` member).
    // `deliver(fd, connection, data)` runs for items whose connection is
    // still open under the same id. Returns the number of dropped items.
    template <typename ConnectionMap, typename Deliver>
    std::size_t dispatch(ConnectionMap &connections, Deliver deliver)
    {
        std::queue<Item> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ready.swap(items_);
        }

        std::size_t dropped = 0;
        while (!ready.empty())
        {
            Item item = std::move(ready.front());
            ready.pop();
            auto it = connections.find(item.fd);
            if (it == connections.end() || it->second.id != item.connection_id)
            {
                ++dropped;
                continue;
            }
            deliver(item.fd, it->second, item.data);
        }
        return dropped;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::queue<Item> items_;
    mutable std::mutex mutex_;
};
