#pragma once
#include <boost/asio/io_context.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class ListError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Queries `<executable> list` for locally installed models.
class ModelLister {
public:
    // models is meaningful only when error is empty.
    using Handler = std::function<void(std::vector<std::string> models, std::string error)>;

    ModelLister(boost::asio::io_context& ioc, std::string executable = "ollama");

    void async_list(Handler handler);

    // Skips the header line; first whitespace-separated column of each row.
    static std::vector<std::string> parse(const std::string& listing);

private:
    boost::asio::io_context& ioc_;
    std::string executable_;
};
