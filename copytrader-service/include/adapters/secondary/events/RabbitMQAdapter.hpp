#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <iostream>

namespace copytrader::adapters::secondary {

/**
 * @brief Публикация статусных уведомлений в RabbitMQ
 *
 * Exchange: topic (copytrader.events), routing key совпадает с topic
 * уведомления: short_sale.task_updated, order.replicated, action.queued...
 * Сервис только публикует; потребители (UI, алертинг) подписываются сами.
 *
 * Публикация идёт через io_context адаптера, поэтому publish() можно
 * вызывать из любых рабочих потоков движка.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , ioContext_()
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQAdapter] Created for " << settings_->describe() << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    /**
     * @brief Опубликовать сообщение
     * @param routingKey Topic уведомления; префикс стенда добавляют настройки
     * @param message JSON-сообщение
     */
    void publish(const std::string& topic, const std::string& message) override {
        auto routingKey = settings_->routingKeyFor(topic);
        if (!running_ || !ready_) {
            std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey << ": not connected" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_) {
                return;
            }
            try {
                channel_->publish(exchangeName_, routingKey, message);
                std::cout << "[RabbitMQAdapter] Published " << routingKey
                          << ": " << message.substr(0, 100) << "..." << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Publish error: " << e.what() << std::endl;
            }
        });
    }

    void start() {
        if (running_.exchange(true)) return;

        workGuard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(ioContext_));
        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) return;

        ready_ = false;
        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

    bool isReady() const { return ready_.load(); }

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(settings_->getAmqpUrl()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* msg) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
            ready_ = false;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
                ready_ = true;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    boost::asio::io_context ioContext_;
    AMQP::LibBoostAsioHandler handler_;
    std::unique_ptr<WorkGuard> workGuard_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace copytrader::adapters::secondary
