#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

static void worker_loop(size_t worker_id, server::competition_server &server, request_queue &requests,
                        const response_handler &respond) {
    LOG(INFO) << "Worker " << worker_id << " started";
    defer {
        LOG(INFO) << "Worker " << worker_id << " stopped";
    };

    while (auto request = requests.pop()) {
        json response;
        try {
            response = server.handle(*request);
        } catch (std::exception &ex) {
            // 单个请求的内部错误不应导致 worker 退出，其他请求仍然可以被处理
            LOG(ERROR) << "Worker " << worker_id << " has crashed when handling " << request->dump() << ", "
                       << ex.what() << endl
                       << boost::diagnostic_information(ex);
            response = {{"error", string("internal error: ") + ex.what()}};
        }

        try {
            respond(response);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " failed to deliver response: " << ex.what();
        }
    }
}

thread start_worker(size_t worker_id, server::competition_server &server, request_queue &requests,
                    response_handler respond) {
    return thread([worker_id, &server, &requests, respond = move(respond)] {
        worker_loop(worker_id, server, requests, respond);
    });
}

}  // namespace arbiter
