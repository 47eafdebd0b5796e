#ifndef __HAVE_INTRUSIVEPTRBASE_HPP__
#define __HAVE_INTRUSIVEPTRBASE_HPP__

#include <cassert>
#include <boost/checked_delete.hpp>
#include <boost/detail/atomic_count.hpp>
#include <boost/intrusive_ptr.hpp>

/**
 * Intrusive reference count for objects handed around as
 * boost::intrusive_ptr<T>. T is the most-derived type, which is what gets
 * deleted when the last reference goes away.
 */
template<class T>
struct IntrusivePtrBase
{
    IntrusivePtrBase(): ref_count(0) {}

    // A copy starts out unreferenced
    IntrusivePtrBase(IntrusivePtrBase<T> const&)
        : ref_count(0) {}

    // The count belongs to the object, not to its value
    IntrusivePtrBase& operator=(IntrusivePtrBase const&)
    {
        return *this;
    }

    friend void intrusive_ptr_add_ref(IntrusivePtrBase<T> const* s)
    {
        assert(s != 0);
        ++s->ref_count;
    }

    friend void intrusive_ptr_release(IntrusivePtrBase<T> const* s)
    {
        assert(s != 0);
        assert(s->ref_count > 0);
        if (--s->ref_count == 0)
            boost::checked_delete(static_cast<T const*>(s));
    }

protected:
    ~IntrusivePtrBase() {}

private:
    // modifiable even through const intrusive_ptr objects
    mutable boost::detail::atomic_count ref_count;
};

#endif // __HAVE_INTRUSIVEPTRBASE_HPP__
