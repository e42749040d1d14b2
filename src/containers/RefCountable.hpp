// RefCountable.hpp ---
//
// Filename: RefCountable.hpp
// Author: Abhishek Udupa
// Created: Tue Jan 27 05:49:00 2015 (-0500)
//
//
// Copyright (c) 2013, Abhishek Udupa, University of Pennsylvania
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. All advertising materials mentioning features or use of this software
//    must display the following acknowledgement:
//    This product includes software developed by The University of Pennsylvania
// 4. Neither the name of the University of Pennsylvania nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDER ''AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//
//

// Code:

#if !defined SYMX_REF_COUNTABLE_HPP_
#define SYMX_REF_COUNTABLE_HPP_

#include <atomic>

#include "../common/SymxFwdDecls.hpp"

namespace SYMX {

    // Base of every node owned through SmartPtr or CSmartPtr.
    // Interned nodes are shared across threads, so the count is
    // atomic. Only the smart pointers touch the count.
    class RefCountable
    {
        template <typename T> friend class SmartPtr;
        template <typename T> friend class CSmartPtr;

    private:
        mutable atomic<u32> RefCount_;

        inline void IncRef_() const
        {
            RefCount_.fetch_add(1, memory_order_relaxed);
        }

        inline void DecRef_() const
        {
            if (RefCount_.fetch_sub(1, memory_order_acq_rel) == 1) {
                delete this;
            }
        }

    protected:
        inline RefCountable()
            : RefCount_(0)
        {
            // Nothing here
        }

        // A copy is a new node with no owners yet
        inline RefCountable(const RefCountable& Other)
            : RefCount_(0)
        {
            // Nothing here
        }

        inline RefCountable& operator = (const RefCountable& Other)
        {
            return *this;
        }

    public:
        virtual ~RefCountable()
        {
            // Nothing here
        }
    };

} /* end namespace SYMX */

#endif /* SYMX_REF_COUNTABLE_HPP_ */

//
// RefCountable.hpp ends here
