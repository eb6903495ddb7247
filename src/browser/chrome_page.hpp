#pragma once
#include <memory>
#include "cdp/cdp_client.hpp"
#include "page.hpp"

namespace Glimpse {
namespace Browser {

// Page backed by one DevTools tab.
class ChromePage : public Page {
public:
    explicit ChromePage(std::shared_ptr<CDP::CDPClient> cdp);

    void set_timeout(std::chrono::seconds timeout) override;

    boost::asio::awaitable<void> set_viewport(int width, int height) override;
    boost::asio::awaitable<void> goto_url(const std::string& url) override;

    boost::asio::awaitable<nlohmann::json> evaluate(const std::string& script) override;
    boost::asio::awaitable<std::string>    screenshot() override;

private:
    std::shared_ptr<CDP::CDPClient> cdp_;
};

}  // namespace Browser
}  // namespace Glimpse
