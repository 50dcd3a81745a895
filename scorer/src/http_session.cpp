/*
 * 설명: HTTP 요청을 읽고 라우터 응답을 직렬화해 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/api_router_test.cpp
 */
#include "scorer/http_session.hpp"

#include <chrono>
#include <string_view>

namespace scorer {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ApiRouter> router)
    : stream_(std::move(socket)), router_(std::move(router)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto result = router_->Handle(req_.method(), std::string_view(req_.target().data(), req_.target().size()),
                                req_.body());

  auto res = std::make_shared<http::response<http::string_body>>();
  res->version(req_.version());
  res->set(http::field::server, "cricket-scorer");
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->result(result.status);
  res->body() = result.body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res) {
  auto self = shared_from_this();
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace scorer
