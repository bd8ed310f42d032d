#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "simple_uikit.hpp"

namespace {

struct contact {
    contact(std::string name, int rank) : m_name(std::move(name)), m_rank(rank) { }

    std::string m_name;
    int m_rank;
};

struct contact_row : public su::refreshable {
    contact_row(std::shared_ptr<contact> c) : m_contact(std::move(c)), m_refreshes(0) { }

    void refresh() {
        ++m_refreshes;
        m_text = m_contact->m_name;
    }

    std::shared_ptr<contact> m_contact;
    std::string m_text;
    int m_refreshes;
};

typedef std::shared_ptr<contact> contact_ptr;
typedef std::shared_ptr<contact_row> row_ptr;

// a list widget delegating item management to its object container
struct contact_list : public su::widget_list<contact_row> {
    contact_list() :
        m_items(*this,
                [this](const contact_ptr& c) {
                    ++m_created;
                    return std::make_shared<contact_row>(c);
                },
                [](const contact& c) { return c.m_rank; }),
        m_created(0)
    { }

    su::object_container<contact, contact_row, int> m_items;
    int m_created;
};

contact_ptr make_contact(const char* name, int rank) {
    return std::make_shared<contact>(name, rank);
}

std::vector<std::string> names(const std::vector<contact_ptr>& items) {
    std::vector<std::string> result;
    for(auto& c : items) {
        result.push_back(c->m_name);
    }
    return result;
}

std::vector<std::string> widget_names(const su::widget_list<contact_row>& list) {
    std::vector<std::string> result;
    for(auto& w : list.widgets()) {
        result.push_back(w->m_contact->m_name);
    }
    return result;
}

}

TEST(simple_uikit, object_container_orders_by_key) {
    contact_list list;
    auto a = make_contact("a", 3);
    auto b = make_contact("b", 1);
    auto c = make_contact("c", 2);

    list.m_items.add_item(a);
    list.m_items.add_item(b);
    list.m_items.add_item(c);

    std::vector<std::string> expected = { "b", "c", "a" };
    EXPECT_EQ(expected, names(list.m_items.items()));
    EXPECT_EQ(expected, widget_names(list));
    EXPECT_EQ(3u, list.m_items.size());
    EXPECT_EQ(3u, list.size());
}

TEST(simple_uikit, object_container_add_is_idempotent) {
    contact_list list;
    auto a = make_contact("a", 1);

    auto w1 = list.m_items.add_item(a);
    auto w2 = list.m_items.add_item(a);
    ASSERT_TRUE(w1);
    EXPECT_EQ(w1, w2);
    EXPECT_EQ(1, list.m_created);
    EXPECT_EQ(1u, list.size());

    EXPECT_EQ(w1, list.m_items.get_widget_for_item(a));
    EXPECT_EQ(a, list.m_items.item_for_widget(w1));
    EXPECT_TRUE(list.m_items.contains_item(a));

    auto unknown = make_contact("x", 0);
    EXPECT_FALSE(list.m_items.get_widget_for_item(unknown));
    EXPECT_FALSE(list.m_items.contains_item(unknown));
    EXPECT_FALSE(list.m_items.add_item(contact_ptr()));
    EXPECT_EQ(1, list.m_created);

    // created on demand
    auto w = list.m_items.get_widget_for_item(unknown, true);
    EXPECT_TRUE(w);
    EXPECT_EQ(2, list.m_created);
    EXPECT_EQ(unknown, list.m_items.item_for_widget(w));
}

TEST(simple_uikit, object_container_keys_stay_sorted) {
    contact_list list;
    std::vector<contact_ptr> contacts;
    int ranks[] = { 5, 1, 4, 1, 5, 9, 2, 6, 5, 3 };

    for(int i = 0; i < 10; ++i) {
        contacts.push_back(make_contact(std::to_string(i).c_str(), ranks[i]));
        list.m_items.add_item(contacts.back());
    }

    auto check_sorted = [&]{
        auto items = list.m_items.items();
        for(std::size_t i = 1; i < items.size(); ++i) {
            EXPECT_LE(items[i - 1]->m_rank, items[i]->m_rank);
        }
    };

    check_sorted();

    EXPECT_TRUE(list.m_items.remove_item(contacts[2]));
    EXPECT_TRUE(list.m_items.remove_item(contacts[5]));
    check_sorted();
    EXPECT_EQ(8u, list.size());
    EXPECT_FALSE(list.m_items.contains_item(contacts[2]));
}

TEST(simple_uikit, object_container_equal_keys_keep_insertion_order) {
    contact_list list;
    list.m_items.add_item(make_contact("first", 1));
    list.m_items.add_item(make_contact("zero", 0));
    list.m_items.add_item(make_contact("second", 1));
    list.m_items.add_item(make_contact("third", 1));

    std::vector<std::string> expected = { "zero", "first", "second", "third" };
    EXPECT_EQ(expected, names(list.m_items.items()));
}

TEST(simple_uikit, object_container_remove_absent_item) {
    contact_list list;
    auto a = make_contact("a", 1);
    list.m_items.add_item(a);

    EXPECT_FALSE(list.m_items.remove_item(make_contact("b", 2)));
    EXPECT_FALSE(list.m_items.remove_item(contact_ptr()));
    EXPECT_EQ(1u, list.size());

    auto w = list.m_items.remove_item(a);
    ASSERT_TRUE(w);
    EXPECT_EQ(a, w->m_contact);
    EXPECT_FALSE(list.m_items.remove_item(a));
    EXPECT_EQ(0u, list.size());
    EXPECT_FALSE(list.m_items.item_for_widget(w));
}

TEST(simple_uikit, object_container_key_change_preserves_focus) {
    contact_list list;
    auto a = make_contact("a", 1);
    auto b = make_contact("b", 2);
    auto c = make_contact("c", 3);

    list.m_items.add_item(a);
    list.m_items.add_item(b);
    list.m_items.add_item(c);
    ASSERT_TRUE(list.focus_position(1));
    EXPECT_EQ(b, list.m_items.selected_item());

    // reverse the order
    list.m_items.key_function([](const contact& x) { return -x.m_rank; });

    std::vector<std::string> expected = { "c", "b", "a" };
    EXPECT_EQ(expected, names(list.m_items.items()));
    EXPECT_EQ(b, list.m_items.selected_item());
    EXPECT_EQ(1, list.focus_position());

    list.focus_position(0);
    list.m_items.key_function([](const contact& x) { return x.m_rank; });
    EXPECT_EQ(c, list.m_items.selected_item());
    EXPECT_EQ(2, list.focus_position());
}

TEST(simple_uikit, object_container_update_order_after_key_change) {
    contact_list list;
    auto a = make_contact("a", 1);
    auto b = make_contact("b", 2);
    auto c = make_contact("c", 3);

    list.m_items.add_item(a);
    list.m_items.add_item(b);
    list.m_items.add_item(c);
    list.focus_position(0);

    a->m_rank = 10;
    list.m_items.update_order();

    std::vector<std::string> expected = { "b", "c", "a" };
    EXPECT_EQ(expected, names(list.m_items.items()));
    EXPECT_EQ(a, list.m_items.selected_item());

    // every widget was refreshed by the reorder
    for(auto& w : list.widgets()) {
        EXPECT_EQ(1, w->m_refreshes);
        EXPECT_EQ(w->m_contact->m_name, w->m_text);
    }
}

TEST(simple_uikit, object_container_insertion_order_without_key) {
    su::widget_list<contact_row> list;
    su::object_container<contact, contact_row, int> items(
        list,
        [](const contact_ptr& c) { return std::make_shared<contact_row>(c); });

    EXPECT_FALSE(items.key_function());

    items.add_item(make_contact("x", 3));
    items.add_item(make_contact("y", 1));
    items.add_item(make_contact("z", 2));

    std::vector<std::string> expected = { "x", "y", "z" };
    EXPECT_EQ(expected, names(items.items()));

    items.key_function([](const contact& c) { return c.m_rank; });
    expected = { "y", "z", "x" };
    EXPECT_EQ(expected, names(items.items()));

    // back to insertion order
    items.key_function(su::object_container<contact, contact_row, int>::key_function_type());
    expected = { "x", "y", "z" };
    EXPECT_EQ(expected, names(items.items()));
}

TEST(simple_uikit, object_container_failing_factory) {
    su::widget_list<contact_row> list;
    su::object_container<contact, contact_row, int> items(
        list,
        [](const contact_ptr& c) {
            return c->m_rank < 0 ? row_ptr() : std::make_shared<contact_row>(c);
        });

    auto bad = make_contact("bad", -1);
    EXPECT_FALSE(items.add_item(bad));
    EXPECT_FALSE(items.contains_item(bad));
    EXPECT_EQ(0u, items.size());
    EXPECT_EQ(0u, list.size());
}

TEST(simple_uikit, object_container_throwing_key_function) {
    su::widget_list<contact_row> list;
    su::object_container<contact, contact_row, int> items(
        list,
        [](const contact_ptr& c) { return std::make_shared<contact_row>(c); },
        [](const contact& c) {
            if(c.m_rank == 99) {
                throw std::runtime_error("no key");
            }
            return c.m_rank;
        });

    auto good = make_contact("good", 1);
    auto bad = make_contact("bad", 99);
    items.add_item(good);

    EXPECT_THROW(items.add_item(bad), std::runtime_error);

    // nothing of the failed item is left behind
    EXPECT_FALSE(items.contains_item(bad));
    EXPECT_EQ(1u, items.size());
    EXPECT_EQ(1u, list.size());
    EXPECT_FALSE(items.get_widget_for_item(bad));

    bad->m_rank = 0;
    auto w = items.add_item(bad);
    ASSERT_TRUE(w);
    EXPECT_EQ(w, list.widget_at(0));
    EXPECT_EQ(2u, items.size());
}

TEST(simple_uikit, object_container_refresh_item) {
    contact_list list;
    auto a = make_contact("a", 1);
    auto w = list.m_items.add_item(a);
    EXPECT_EQ(0, w->m_refreshes);

    a->m_name = "renamed";
    EXPECT_EQ(w, list.m_items.refresh_item(a));
    EXPECT_EQ(1, w->m_refreshes);
    EXPECT_EQ(std::string("renamed"), w->m_text);

    auto b = make_contact("b", 2);
    EXPECT_FALSE(list.m_items.refresh_item(b));

    auto wb = list.m_items.refresh_item(b, true);
    ASSERT_TRUE(wb);
    EXPECT_EQ(1, wb->m_refreshes);
    EXPECT_EQ(2u, list.size());
}

TEST(simple_uikit, object_container_selection) {
    contact_list list;
    std::vector<contact_ptr> selected;

    EXPECT_FALSE(list.m_items.selected_item());
    EXPECT_FALSE(list.m_items.emit_item_selected());

    auto a = make_contact("a", 1);
    auto b = make_contact("b", 2);
    list.m_items.add_item(a);
    list.m_items.add_item(b);

    // no handler yet
    EXPECT_FALSE(list.m_items.emit_item_selected());

    list.m_items.on_item_selected([&](const contact_ptr& c) { selected.push_back(c); });
    EXPECT_TRUE(list.m_items.emit_item_selected());
    list.focus_position(1);
    EXPECT_TRUE(list.m_items.emit_item_selected());

    ASSERT_EQ(2u, selected.size());
    EXPECT_EQ(a, selected[0]);
    EXPECT_EQ(b, selected[1]);
}

TEST(simple_uikit, object_container_clear) {
    contact_list list;
    auto a = make_contact("a", 1);
    auto w = list.m_items.add_item(a);
    list.m_items.add_item(make_contact("b", 2));

    list.m_items.clear();
    EXPECT_EQ(0u, list.m_items.size());
    EXPECT_EQ(0u, list.size());
    EXPECT_EQ(-1, list.focus_position());
    EXPECT_FALSE(list.m_items.contains_item(a));
    EXPECT_FALSE(list.m_items.item_for_widget(w));

    // the same item can be added again and gets a new widget
    auto w2 = list.m_items.add_item(a);
    EXPECT_TRUE(w2);
    EXPECT_NE(w, w2);
}
