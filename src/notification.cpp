#include "notification.hpp"
#include "freight_errors.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <format>

namespace {

size_t discardResponse([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

struct MailPayload {
    std::string text;
    std::size_t offset = 0;
};

size_t readPayload(char* buffer, size_t size, size_t nmemb, void* userp) {
    auto* payload = static_cast<MailPayload*>(userp);
    const std::size_t room = size * nmemb;
    const std::size_t left = payload->text.size() - payload->offset;
    const std::size_t n = std::min(room, left);
    std::memcpy(buffer, payload->text.data() + payload->offset, n);
    payload->offset += n;
    return n;
}

std::string rfc2822Date() {
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmNow{};
#ifdef _WIN32
    gmtime_s(&tmNow, &timeT);
#else
    gmtime_r(&timeT, &tmNow);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S +0000", &tmNow);
    return buf;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(config["bot_token"].asString()), chatId(config["chat_id"].asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw ConfigurationError("Telegram notifications require bot_token and chat_id");
    }
}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const std::string& message) {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    char* escaped = curl_easy_escape(curl.get(), message.c_str(), static_cast<int>(message.length()));
    if (!escaped) {
        return std::unexpected("Failed to escape Telegram message");
    }
    std::string escapedMessage = escaped;
    curl_free(escaped);
    std::string url = std::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}",
        botToken, chatId, escapedMessage);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discardResponse);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 30L);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send Telegram notification: {}", curl_easy_strerror(res)));
    }
    return {};
}

EmailNotificationStrategy::EmailNotificationStrategy(const Json::Value& config)
    : emailTo(config["email_to"].asString()),
      emailFrom(config.get("email_from", config["email_to"]).asString()),
      smtpServer(config["smtp_server"].asString()),
      username(config.get("username", "").asString()),
      password(config.get("password", "").asString()) {
    if (emailTo.empty() || smtpServer.empty()) {
        throw ConfigurationError("Email notifications require email_to and smtp_server");
    }
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::string& message) {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    MailPayload payload;
    payload.text = std::format("Date: {}\r\nTo: <{}>\r\nFrom: <{}>\r\nSubject: DataFreight run report\r\n\r\n{}\r\n",
                               rfc2822Date(), emailTo, emailFrom, message);

    curl_slist* recipients = curl_slist_append(nullptr, std::format("<{}>", emailTo).c_str());
    const std::string from = std::format("<{}>", emailFrom);

    curl_easy_setopt(curl.get(), CURLOPT_URL, smtpServer.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_TRY));
    if (!username.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, username.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, password.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readPayload);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &payload);
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 60L);

    CURLcode res = curl_easy_perform(curl.get());
    curl_slist_free_all(recipients);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send email notification: {}", curl_easy_strerror(res)));
    }
    return {};
}

std::unique_ptr<NotificationStrategy> makeNotificationStrategy(const Json::Value& telegramConfig,
                                                               const Json::Value& emailConfig) {
    if (!telegramConfig.isNull() && !telegramConfig.empty()) {
        return std::make_unique<TelegramNotificationStrategy>(telegramConfig);
    }
    if (!emailConfig.isNull() && !emailConfig.empty()) {
        return std::make_unique<EmailNotificationStrategy>(emailConfig);
    }
    return nullptr;
}
