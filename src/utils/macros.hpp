/* SPDX-License-Identifier: MPL-2.0 */

/******************************************************************************/
/*  zxfer Internal Use                                                        */
/******************************************************************************/

#define LIBZXFER_UNUSED(object) (void) object
#define LIBZXFER_DELETE(p_object)                                              \
    {                                                                          \
        delete p_object;                                                       \
        p_object = 0;                                                          \
    }

/******************************************************************************/

#if !defined ZXFER_NOEXCEPT
#if defined ZXFER_HAVE_NOEXCEPT
#define ZXFER_NOEXCEPT noexcept
#else
#define ZXFER_NOEXCEPT
#endif
#endif

#if !defined ZXFER_OVERRIDE
#if defined ZXFER_HAVE_NOEXCEPT
#define ZXFER_OVERRIDE override
#else
#define ZXFER_OVERRIDE
#endif
#endif

#if !defined ZXFER_FINAL
#if defined ZXFER_HAVE_NOEXCEPT
#define ZXFER_FINAL final
#else
#define ZXFER_FINAL
#endif
#endif

#if !defined ZXFER_DEFAULT
#if defined ZXFER_HAVE_NOEXCEPT
#define ZXFER_DEFAULT = default;
#else
#define ZXFER_DEFAULT                                                          \
    {                                                                          \
    }
#endif
#endif

#if !defined ZXFER_NON_COPYABLE_NOR_MOVABLE
#if defined ZXFER_HAVE_NOEXCEPT
#define ZXFER_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define ZXFER_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif
#endif
