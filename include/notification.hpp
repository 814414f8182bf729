/**
 * @file notification.hpp
 * @brief Run notifications for DataFreight dispatches.
 *
 * After a dispatch the aggregate summary is sent to the configured channel. Telegram
 * and SMTP email are supported, both through libcurl.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <expected>
#include <memory>
#include <string>
#include <json/json.h>

/**
 * @brief Channel that receives the dispatch summary.
 */
class NotificationStrategy {
public:
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Delivers one summary message.
     *
     * A delivery failure is reported to the caller and never fails the dispatch.
     *
     * @param message Summary text.
     * @return std::expected<void, std::string> Nothing, or why delivery failed.
     */
    virtual std::expected<void, std::string> notify(const std::string& message) = 0;
};

/**
 * @brief Posts the summary to a Telegram chat through the Bot API sendMessage call.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @param config The "telegram" config object, with bot_token and chat_id.
     * @throws ConfigurationError If either field is missing.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const std::string& message) override;

private:
    std::string botToken;
    std::string chatId;
};

/**
 * @brief Mails the summary over SMTP, upgrading to TLS when the server offers it.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @param config JSON configuration with email_to, email_from, smtp_server
     * (e.g., "smtps://mail.example.com:465") and optional username/password.
     * @throws ConfigurationError If configuration is invalid.
     */
    explicit EmailNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const std::string& message) override;

private:
    std::string emailTo;
    std::string emailFrom;
    std::string smtpServer; ///< e.g. smtps://mail.example.com:465
    std::string username; ///< Empty disables SMTP AUTH.
    std::string password;
};

/**
 * @brief Builds the notification channel from the configuration.
 *
 * Telegram wins when both channels are configured.
 *
 * @return std::unique_ptr<NotificationStrategy> The strategy, or nullptr when none is configured.
 */
std::unique_ptr<NotificationStrategy> makeNotificationStrategy(const Json::Value& telegramConfig,
                                                               const Json::Value& emailConfig);

#endif // NOTIFICATION_HPP
