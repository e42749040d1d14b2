// SmartPtr.hpp ---
//
// Filename: SmartPtr.hpp
// Author: Abhishek Udupa
// Created: Thu Apr 09 20:26:00 2015 (-0500)
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

#if !defined SYMX_SMART_PTR_HPP_
#define SYMX_SMART_PTR_HPP_

#include <utility>

#include "../common/SymxFwdDecls.hpp"

namespace SYMX {

    // Intrusive smart pointers over RefCountable objects.
    // SmartPtr hands out mutable access, CSmartPtr only
    // const access. Comparisons are on pointer identity.
    template <typename T>
    class SmartPtr
    {
        friend class CSmartPtr<T>;
    private:
        T* Ptr_;

    public:
        static const SmartPtr NullPtr;

        inline SmartPtr()
            : Ptr_(nullptr)
        {
            // Nothing here
        }

        inline SmartPtr(const SmartPtr& Other)
            : Ptr_(Other.Ptr_)
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        inline SmartPtr(SmartPtr&& Other)
            : Ptr_(nullptr)
        {
            swap(Ptr_, Other.Ptr_);
        }

        inline SmartPtr(T* OtherPtr)
            : Ptr_(OtherPtr)
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        inline ~SmartPtr()
        {
            if (Ptr_ != nullptr) {
                Ptr_->DecRef_();
            }
            Ptr_ = nullptr;
        }

        inline SmartPtr& operator = (SmartPtr Other)
        {
            swap(Ptr_, Other.Ptr_);
            return (*this);
        }

        inline T* GetPtr_() const { return Ptr_; }
        // casting, use at your own risk!
        inline operator T* () const { return Ptr_; }
        inline T* operator -> () const { return Ptr_; }
        inline T& operator * () const { return *Ptr_; }

        inline bool operator == (const SmartPtr& Other) const { return Ptr_ == Other.Ptr_; }
        inline bool operator != (const SmartPtr& Other) const { return Ptr_ != Other.Ptr_; }
        inline bool operator < (const SmartPtr& Other) const { return Ptr_ < Other.Ptr_; }
        inline bool operator == (const T* OtherPtr) const { return Ptr_ == OtherPtr; }
        inline bool operator != (const T* OtherPtr) const { return Ptr_ != OtherPtr; }

        inline bool operator ! () const { return (Ptr_ == nullptr); }
        inline bool IsNull_() const { return (Ptr_ == nullptr); }
    };

    template <typename T>
    class CSmartPtr
    {
    private:
        const T* Ptr_;

    public:
        static const CSmartPtr NullPtr;

        inline CSmartPtr()
            : Ptr_(nullptr)
        {
            // Nothing here
        }

        inline CSmartPtr(const CSmartPtr& Other)
            : Ptr_(Other.Ptr_)
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        inline CSmartPtr(CSmartPtr&& Other)
            : Ptr_(nullptr)
        {
            swap(Ptr_, Other.Ptr_);
        }

        inline CSmartPtr(const SmartPtr<T>& Other)
            : Ptr_(Other.Ptr_)
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        inline CSmartPtr(const T* OtherPtr)
            : Ptr_(OtherPtr)
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        // Upcasts from pointers to derived classes
        template <typename U>
        inline CSmartPtr(const CSmartPtr<U>& Other)
            : Ptr_(Other.GetPtr_())
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        template <typename U>
        inline CSmartPtr(const SmartPtr<U>& Other)
            : Ptr_(Other.GetPtr_())
        {
            if (Ptr_ != nullptr) {
                Ptr_->IncRef_();
            }
        }

        inline ~CSmartPtr()
        {
            if (Ptr_ != nullptr) {
                Ptr_->DecRef_();
            }
            Ptr_ = nullptr;
        }

        inline CSmartPtr& operator = (CSmartPtr Other)
        {
            swap(Ptr_, Other.Ptr_);
            return (*this);
        }

        inline const T* GetPtr_() const { return Ptr_; }
        // casting, use at your own risk!
        inline operator const T* () const { return Ptr_; }
        inline const T* operator -> () const { return Ptr_; }
        inline const T& operator * () const { return *Ptr_; }

        inline bool operator == (const CSmartPtr& Other) const { return Ptr_ == Other.Ptr_; }
        inline bool operator != (const CSmartPtr& Other) const { return Ptr_ != Other.Ptr_; }
        inline bool operator < (const CSmartPtr& Other) const { return Ptr_ < Other.Ptr_; }
        inline bool operator == (const T* OtherPtr) const { return Ptr_ == OtherPtr; }
        inline bool operator != (const T* OtherPtr) const { return Ptr_ != OtherPtr; }

        inline bool operator ! () const { return (Ptr_ == nullptr); }
        inline bool IsNull_() const { return (Ptr_ == nullptr); }
    };

    template <typename T>
    const SmartPtr<T> SmartPtr<T>::NullPtr;

    template <typename T>
    const CSmartPtr<T> CSmartPtr<T>::NullPtr;

    // Identity hashing, for tables keyed on interned objects
    class SmartPtrIdentityHasher
    {
    public:
        template <typename T>
        inline u64 operator () (const CSmartPtr<T>& Ptr) const
        {
            return std::hash<const T*>()(Ptr.GetPtr_());
        }

        template <typename T>
        inline u64 operator () (const SmartPtr<T>& Ptr) const
        {
            return std::hash<const T*>()(Ptr.GetPtr_());
        }
    };

} /* end namespace */

#endif /* SYMX_SMART_PTR_HPP_ */

//
// SmartPtr.hpp ends here
