#include "rxpos/domain/json_codec.hpp"

namespace rxpos {
namespace domain {

void to_json(nlohmann::json& j, const CartLine& line) {
  j = nlohmann::json{{"medicine_id", line.medicine_id},
                     {"name", line.name},
                     {"quantity", line.quantity},
                     {"unit_price", line.unit_price},
                     {"total_price", line.total_price},
                     {"batch_no", line.batch_no}};
}

void from_json(const nlohmann::json& j, CartLine& line) {
  j.at("medicine_id").get_to(line.medicine_id);
  j.at("name").get_to(line.name);
  j.at("quantity").get_to(line.quantity);
  j.at("unit_price").get_to(line.unit_price);
  j.at("total_price").get_to(line.total_price);

  auto it = j.find("batch_no");
  if (it != j.end() && it->is_string()) {
    it->get_to(line.batch_no);
  } else {
    line.batch_no.clear();
  }
}

void to_json(nlohmann::json& j, const CartTotals& totals) {
  j = nlohmann::json{{"subtotal", totals.subtotal},
                     {"discount", totals.discount},
                     {"tax", totals.tax},
                     {"total", totals.total}};
}

void to_json(nlohmann::json& j, const CartSummary& summary) {
  j = nlohmann::json{{"item_count", summary.item_count},
                     {"total_quantity", summary.total_quantity},
                     {"totals", summary.totals},
                     {"tax_rate_percent", summary.tax_rate_percent},
                     {"payment_method", toString(summary.payment_method)},
                     {"lines", summary.lines}};
}

void to_json(nlohmann::json& j, const MedicineRecord& medicine) {
  j = nlohmann::json{{"id", medicine.id},
                     {"name", medicine.name},
                     {"category", medicine.category},
                     {"batch_no", medicine.batch_no},
                     {"expiry_date", medicine.expiry_date},
                     {"quantity", medicine.quantity},
                     {"purchase_price", medicine.purchase_price},
                     {"selling_price", medicine.selling_price}};
  j["barcode"] = medicine.barcode ? nlohmann::json(*medicine.barcode)
                                  : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const SaleRecord& sale) {
  j = nlohmann::json{{"id", sale.id},
                     {"date", sale.date},
                     {"items", sale.items},
                     {"subtotal", sale.subtotal},
                     {"discount", sale.discount},
                     {"tax", sale.tax},
                     {"total", sale.total},
                     {"payment_method", toString(sale.payment_method)},
                     {"created_at", sale.created_at}};
  j["cashier_id"] = sale.cashier_id ? nlohmann::json(*sale.cashier_id)
                                    : nlohmann::json(nullptr);
  j["customer_name"] = sale.customer_name
                           ? nlohmann::json(*sale.customer_name)
                           : nlohmann::json(nullptr);
}

}  // namespace domain
}  // namespace rxpos
