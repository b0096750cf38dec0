#include "server/broadcast.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

shared_ptr<subscription> subscriber_hub::subscribe() {
    auto sub = make_shared<subscription>();
    scoped_lock lock(mut);
    subscribers.push_back(sub);
    return sub;
}

size_t subscriber_hub::broadcast(const json &message) {
    scoped_lock lock(mut);
    size_t delivered = 0;
    // push 失败说明订阅者已经关闭了队列
    subscribers.erase(remove_if(subscribers.begin(), subscribers.end(), [&](const shared_ptr<subscription> &sub) {
                          if (!sub->push(message)) return true;
                          ++delivered;
                          return false;
                      }),
                      subscribers.end());
    return delivered;
}

void subscriber_hub::operator()(const server_event &event) {
    json message;
    to_json(message, event);
    size_t delivered = broadcast(message);
    DLOG(INFO) << "Broadcast " << event_kind(event) << " to " << delivered << " subscribers";
}

size_t subscriber_hub::subscriber_count() const {
    scoped_lock lock(mut);
    return subscribers.size();
}

}  // namespace arbiter::server
