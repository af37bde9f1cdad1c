#pragma once

namespace cafe::http {

/// Ключ идемпотентности создания заказа (gateway -> order-service)
constexpr const char* IDEMPOTENCY_KEY_HEADER = "X-Idempotency-Key";

/// Ответ повторён из хранилища идемпотентности
constexpr const char* IDEMPOTENCY_KEY_USED_HEADER = "X-Idempotency-Key-Used";

} // namespace cafe::http
