//
// Created by jonas on 09.03.21.
//

#ifndef SAFEVERBS_IBVPROTECTIONDOMAIN_HPP
#define SAFEVERBS_IBVPROTECTIONDOMAIN_HPP

#include <infiniband/verbs.h>
#include "IBvContext.hpp"
#include "IBvHandle.hpp"

/**
 * Protection domain. Memory regions, queue pairs and everything else created from it keep it (and its context) alive.
 */
class IBvProtectionDomain {
    public:
        explicit IBvProtectionDomain(const IBvContext &context);

        [[nodiscard]] ibv_pd *get() const;

        [[nodiscard]] const IBvContext &context() const;

        [[nodiscard]] long useCount() const;

        bool operator==(const IBvProtectionDomain &other) const;

    private:
        IBvContext ctx;
        IBvHandle<ibv_pd> pd;
};

#endif //SAFEVERBS_IBVPROTECTIONDOMAIN_HPP
