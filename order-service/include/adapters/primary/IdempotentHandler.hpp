#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "http/Headers.hpp"
#include "http/StatusMapping.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cafe::orders::adapters::primary {

// Перехват статуса и тела ответа внутреннего handler'а
class ResponseCapture : public IResponse {
public:
    explicit ResponseCapture(IResponse& inner) : inner_(inner) {}

    void setStatus(int code) override {
        status_ = code;
        inner_.setStatus(code);
    }

    void setBody(const std::string& body) override {
        body_ = body;
        inner_.setBody(body);
    }

    void setHeader(const std::string& name, const std::string& value) override {
        inner_.setHeader(name, value);
    }

    int getStatus() const { return status_; }
    std::string getBody() const { return body_; }

private:
    IResponse& inner_;
    int status_ = 0;
    std::string body_;
};

/**
 * @brief Повтор POST с тем же X-Idempotency-Key получает сохранённый ответ
 *
 * Gateway повторяет создание заказа после таймаута с тем же ключом, пока
 * первая попытка ещё может выполняться. Запросы с одинаковым ключом
 * сериализуются: второй дождётся первого и получит его ответ из хранилища.
 * Сохраняются только 2xx ответы.
 *
 * Слот ключа живёт, пока его держит или ждёт хотя бы один запрос,
 * поэтому опоздавший запрос встаёт в ту же очередь.
 */
class IdempotentHandler : public IHttpHandler {
public:
    IdempotentHandler(std::shared_ptr<IHttpHandler> inner,
                      std::shared_ptr<ports::output::IIdempotencyRepository> repo)
        : inner_(std::move(inner))
        , repo_(std::move(repo))
    {
        std::cout << "[IdempotentHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string key = req.getHeader(http::IDEMPOTENCY_KEY_HEADER).value_or("");

        if (req.getMethod() != "POST" || key.empty()) {
            inner_->handle(req, res);
            return;
        }

        SlotLease lease(*this, key);
        std::lock_guard<std::mutex> keyLock(lease.slot->mutex);

        std::optional<domain::IdempotencyRecord> cached;
        try {
            cached = repo_->findByKey(key);
        } catch (const std::exception& e) {
            std::cerr << "[IdempotentHandler] Lookup for key " << key << " failed: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
            return;
        }

        if (cached) {
            std::cout << "[IdempotentHandler] Replay for key: " << key << std::endl;
            res.setStatus(cached->status);
            res.setBody(cached->body);
            res.setHeader("Content-Type", "application/json");
            res.setHeader(http::IDEMPOTENCY_KEY_USED_HEADER, "true");
            return;
        }

        ResponseCapture capture(res);
        inner_->handle(req, capture);

        if (capture.getStatus() >= 200 && capture.getStatus() < 300) {
            // заказ уже создан: ответ клиенту остаётся 2xx, даже если ключ не сохранился
            try {
                repo_->saveIfAbsent({key, capture.getStatus(), capture.getBody()});
            } catch (const std::exception& e) {
                std::cerr << "[IdempotentHandler] Key " << key << " not stored, retry may duplicate: "
                          << e.what() << std::endl;
            }
        }
    }

    /// Число ключей с активными запросами
    size_t activeKeys() const {
        std::lock_guard<std::mutex> lock(slotsMutex_);
        return slots_.size();
    }

private:
    struct KeySlot {
        std::mutex mutex;
        int holders = 0;  // под slotsMutex_
    };

    // Захват слота ключа на время запроса; последний освободивший удаляет слот
    struct SlotLease {
        SlotLease(IdempotentHandler& owner, const std::string& key)
            : owner_(owner), key_(key)
        {
            std::lock_guard<std::mutex> lock(owner_.slotsMutex_);
            auto& entry = owner_.slots_[key_];
            if (!entry) {
                entry = std::make_shared<KeySlot>();
            }
            ++entry->holders;
            slot = entry;
        }

        ~SlotLease() {
            std::lock_guard<std::mutex> lock(owner_.slotsMutex_);
            if (--slot->holders == 0) {
                owner_.slots_.erase(key_);
            }
        }

        SlotLease(const SlotLease&) = delete;
        SlotLease& operator=(const SlotLease&) = delete;

        std::shared_ptr<KeySlot> slot;

    private:
        IdempotentHandler& owner_;
        std::string key_;
    };

    std::shared_ptr<IHttpHandler> inner_;
    std::shared_ptr<ports::output::IIdempotencyRepository> repo_;

    mutable std::mutex slotsMutex_;
    std::map<std::string, std::shared_ptr<KeySlot>> slots_;
};

} // namespace cafe::orders::adapters::primary
