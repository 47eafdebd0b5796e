#ifndef __HAVE_ATOMICCACHE__
#define __HAVE_ATOMICCACHE__

#include <atomic>
#include <memory>

namespace xmlextract
{

/**
 * Lazily created, process-wide instance of T.
 *
 * get() returns the published instance, or builds a candidate with the
 * supplied creator and publishes it with a compare-and-set. Threads racing
 * on the first call may each build a candidate; exactly one is published
 * and the others are destroyed without ever being handed out. No lock is
 * held while a candidate is built. If the creator throws, nothing is
 * published and the next call tries again.
 *
 * Declare instances with static storage duration; the constructor is
 * constexpr so they are constant-initialized.
 */
template <class T>
class AtomicCache
{
    public:
        constexpr AtomicCache()
            : cached( nullptr ) {}

        ~AtomicCache() {
            delete cached.load();
        }

        // 'create' is called as create() and returns std::unique_ptr<T>
        template <class Creator>
        T& get(Creator create) {
            T* current = cached.load( std::memory_order_acquire );
            if ( current ) {
                return *current;
            }

            std::unique_ptr<T> candidate( create() );
            T* expected = nullptr;
            if ( cached.compare_exchange_strong( expected, candidate.get()
                                               , std::memory_order_acq_rel
                                               , std::memory_order_acquire ) ) {
                return *candidate.release();
            }
            // lost the race; 'candidate' is discarded
            return *expected;
        }

        // Published instance, or nullptr before the first successful get()
        T* peek() const {
            return cached.load( std::memory_order_acquire );
        }

    private:
        AtomicCache(const AtomicCache&) = delete;
        AtomicCache& operator=(const AtomicCache&) = delete;

        std::atomic<T*> cached;
};

} // namespace xmlextract

#endif // __HAVE_ATOMICCACHE__
