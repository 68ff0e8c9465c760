#include "model_lister.hpp"
#include "executors/subprocess.hpp"
#include <cctype>
#include <sstream>

ModelLister::ModelLister(boost::asio::io_context& ioc, std::string executable)
    : ioc_(ioc), executable_(std::move(executable)) {}

void ModelLister::async_list(Handler handler) {
    ProcessSpec spec;
    spec.argv = {executable_, "list"};
    Subprocess::async_run(ioc_, std::move(spec), [handler = std::move(handler)](ProcessOutcome o) {
        switch (o.end) {
        case ProcessEnd::Exited:
            if (o.exit_code != 0) {
                handler({}, "Ollama list failed: " + o.err);
                return;
            }
            handler(parse(o.out), {});
            return;
        case ProcessEnd::Signaled:
            handler({}, "Ollama list failed: " + o.err);
            return;
        case ProcessEnd::TimedOut:
            handler({}, "Ollama list failed: " + o.error);
            return;
        case ProcessEnd::Failed:
            handler({}, "Failed to execute ollama: " + o.error);
            return;
        }
    });
}

std::vector<std::string> ModelLister::parse(const std::string& listing) {
    std::vector<std::string> models;
    std::istringstream in(listing);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            // Leading blank lines are not the header.
            if (line.find_first_not_of(" \t\r") != std::string::npos) header = false;
            continue;
        }
        // A row starting with whitespace has an empty first column.
        if (line.empty() || std::isspace(static_cast<unsigned char>(line[0]))) continue;
        models.push_back(line.substr(0, line.find_first_of(" \t\r")));
    }
    return models;
}
